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

#pragma once

#include "monitor/board.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace flashwatch::monitor {

struct ProgressCfg {
  // Observed flash time of the gateway image: 12 min 50 s.
  std::chrono::milliseconds total{770'000};
  std::chrono::milliseconds tick{10'000};

  // ceil(total / tick), at least 1. 77 with the defaults.
  std::uint32_t tick_count() const noexcept;
};

/*
 * Time-based progress ESTIMATE. It never looks at what the board sends: once
 * the first line arrives it adds 100/tick_count percentage points per tick
 * and declares the board done when the assumed flash time has passed. A board
 * that hangs silently after its first line still reaches 100%. Only the
 * completion marker is evidence of a real flash; reaching 100 here is a
 * timeout that is reported as success, by design of the bench procedure.
 *
 * Not thread-safe; owned by one BoardSession worker.
 */
class ProgressEstimator {
public:
  enum class Step { Ignored, Advanced, Finished };

  explicit ProgressEstimator(ProgressCfg cfg = {});

  // Arms the estimator. Later calls keep the first start instant.
  void start(Clock::time_point now) noexcept;

  // Ticks that should have elapsed at `now`, capped at tick_count(). The
  // session catches up to this, so a late wake-up does not drift.
  std::uint32_t ticks_due(Clock::time_point now) const noexcept;

  // One tick. Ignored before start() and after the estimate is finished.
  Step tick() noexcept;

  // Marker seen: jump straight to 100 and stop ticking.
  void complete() noexcept;

  bool started() const noexcept { return started_; }
  bool finished() const noexcept { return finished_; }
  std::uint32_t ticks() const noexcept { return ticks_; }
  double percent() const noexcept { return percent_; }
  Clock::time_point started_at() const noexcept { return start_; }

private:
  ProgressCfg cfg_;
  std::uint32_t total_ticks_;

  std::uint32_t ticks_ = 0;
  double percent_ = 0.0;
  bool started_ = false;
  bool finished_ = false;
  Clock::time_point start_{};
};

// HH:MM:SS.mmm, hours wrap at 24. Display only.
std::string format_elapsed(std::chrono::milliseconds elapsed);

} // namespace flashwatch::monitor
