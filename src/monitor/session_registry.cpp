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

#include "monitor/session_registry.hpp"

#include "platform/platform_all.hpp"

#include <algorithm>
#include <utility>

#include <spdlog/spdlog.h>

namespace flashwatch::monitor {

using flashwatch::core::Errc;
using flashwatch::core::Result;
using flashwatch::core::Status;

SessionRegistry::SessionRegistry(Cfg cfg, ChannelFactory factory)
    : cfg_(std::move(cfg)), factory_(std::move(factory)) {
  if (!factory_) {
    factory_ = [] { return std::make_unique<flashwatch::platform::TtySerial>(); };
  }
}

SessionRegistry::~SessionRegistry() { stop_all(); }

Result<BoardId> SessionRegistry::register_board(std::string port, int baud) {
  if (port.empty()) return Result<BoardId>::Fail(Errc::Usage, "Empty port name");
  if (baud <= 0) return Result<BoardId>::Failf(Errc::Usage, "Invalid baud rate {} for {}", baud, port);

  std::lock_guard lk(mtx_);
  if (closing_) return Result<BoardId>::Failf(Errc::Usage, "Cannot add {}: monitor is shutting down", port);

  const BoardId id = next_id_++;

  auto channel = factory_();
  if (!channel) return Result<BoardId>::Failf(Errc::PortOpen, "Board {}: no channel for {}", id, port);

  auto session = std::make_unique<BoardSession>(
      Board{.id = id, .port = std::move(port), .baud = baud}, std::move(channel), cfg_,
      [this](Event ev) { events_.push(std::move(ev)); });

  auto st = session->start();
  if (!st.ok) return Result<BoardId>::Fail(std::move(st));

  spdlog::info("Board {}: added {} ({} baud)", id, session->board().port, baud);
  sessions_.emplace(id, std::move(session));
  return Result<BoardId>::Ok(id);
}

Status SessionRegistry::stop_board(BoardId id) {
  std::unique_ptr<BoardSession> victim;
  {
    std::lock_guard lk(mtx_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return Status::Failf(Errc::Usage, "Unknown board {}", id);
    victim = std::move(it->second);
    sessions_.erase(it);
  }

  victim->stop();
  spdlog::info("Board {}: removed {}", id, victim->board().port);
  return Status::Ok();
}

void SessionRegistry::stop_all() noexcept {
  std::map<BoardId, std::unique_ptr<BoardSession>> all;
  {
    std::lock_guard lk(mtx_);
    closing_ = true;
    all.swap(sessions_);
  }
  if (all.empty()) return;

  for (auto& [id, s] : all) s->request_stop();
  for (auto& [id, s] : all) s->stop();

  spdlog::debug("Stopped {} board session(s)", all.size());
}

std::optional<Event> SessionRegistry::next_event(std::chrono::milliseconds wait) {
  return events_.pop_for(wait);
}

std::vector<BoardId> SessionRegistry::ids() const {
  std::lock_guard lk(mtx_);
  std::vector<BoardId> out;
  out.reserve(sessions_.size());
  for (const auto& [id, s] : sessions_) out.push_back(id);
  return out;
}

std::optional<SessionSnapshot> SessionRegistry::snapshot(BoardId id) const {
  std::lock_guard lk(mtx_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second->snapshot();
}

std::optional<std::string> SessionRegistry::elapsed_text(BoardId id, Clock::time_point now) const {
  std::lock_guard lk(mtx_);
  auto it = sessions_.find(id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second->elapsed_text(now);
}

bool SessionRegistry::all_settled() const {
  std::lock_guard lk(mtx_);
  return std::all_of(sessions_.begin(), sessions_.end(),
                     [](const auto& kv) { return is_settled(kv.second->state()); });
}

std::size_t SessionRegistry::size() const {
  std::lock_guard lk(mtx_);
  return sessions_.size();
}

} // namespace flashwatch::monitor
