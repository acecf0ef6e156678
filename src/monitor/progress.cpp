/*
 * Copyright (c) 2026 Gabriel2392
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "monitor/progress.hpp"

#include <algorithm>

#include <fmt/format.h>

namespace flashwatch::monitor {

std::uint32_t ProgressCfg::tick_count() const noexcept {
  const auto t = std::max<std::int64_t>(tick.count(), 1);
  const auto d = std::max<std::int64_t>(total.count(), 1);
  return static_cast<std::uint32_t>(std::max<std::int64_t>((d + t - 1) / t, 1));
}

ProgressEstimator::ProgressEstimator(ProgressCfg cfg)
    : cfg_(cfg), total_ticks_(cfg_.tick_count()) {}

void ProgressEstimator::start(Clock::time_point now) noexcept {
  if (started_) return;
  started_ = true;
  start_ = now;
}

std::uint32_t ProgressEstimator::ticks_due(Clock::time_point now) const noexcept {
  if (!started_ || now <= start_) return 0;
  const auto tick = std::max<std::int64_t>(cfg_.tick.count(), 1);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_).count();
  return static_cast<std::uint32_t>(std::min<std::int64_t>(elapsed / tick, total_ticks_));
}

ProgressEstimator::Step ProgressEstimator::tick() noexcept {
  if (!started_ || finished_) return Step::Ignored;

  ++ticks_;
  if (ticks_ >= total_ticks_) {
    ticks_ = total_ticks_;
    percent_ = 100.0;
    finished_ = true;
    return Step::Finished;
  }

  // Computed from the count, not accumulated, so tick_count() ticks land on exactly 100.
  percent_ = std::clamp(static_cast<double>(ticks_) * 100.0 / static_cast<double>(total_ticks_), percent_, 100.0);
  return Step::Advanced;
}

void ProgressEstimator::complete() noexcept {
  percent_ = 100.0;
  finished_ = true;
}

std::string format_elapsed(std::chrono::milliseconds elapsed) {
  const std::int64_t ms = std::max<std::int64_t>(elapsed.count(), 0);
  return fmt::format("{:02}:{:02}:{:02}.{:03}",
                     (ms / 3'600'000) % 24,
                     (ms / 60'000) % 60,
                     (ms / 1'000) % 60,
                     ms % 1'000);
}

} // namespace flashwatch::monitor
