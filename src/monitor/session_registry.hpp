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

#include "core/event_channel.hpp"
#include "core/serial_channel.hpp"
#include "core/status.hpp"
#include "monitor/board.hpp"
#include "monitor/board_session.hpp"
#include "monitor/cfg.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flashwatch::monitor {

// Owns every BoardSession and is the one place their events come out of.
// Board ids start at 1 and are never handed out twice by the same registry.
// Meant for a bench with a handful of boards: each one costs a thread.
class SessionRegistry {
public:
  using ChannelFactory = std::function<std::unique_ptr<flashwatch::core::ISerialChannel>()>;

  // Without a factory, boards are opened as local ttys.
  explicit SessionRegistry(Cfg cfg, ChannelFactory factory = {});
  ~SessionRegistry();

  SessionRegistry(const SessionRegistry&) = delete;
  SessionRegistry& operator=(const SessionRegistry&) = delete;

  // Creates and starts a session. Port problems are not reported here; they
  // arrive as a PortError event. Fails once stop_all() has been called.
  flashwatch::core::Result<BoardId> register_board(std::string port, int baud);
  flashwatch::core::Result<BoardId> register_board(std::string port) { return register_board(std::move(port), cfg_.baud); }

  flashwatch::core::Status stop_board(BoardId id);

  // Stops every session and joins every worker before returning.
  void stop_all() noexcept;

  std::optional<Event> next_event(std::chrono::milliseconds wait);
  std::optional<Event> poll_event() { return events_.try_pop(); }

  std::vector<BoardId> ids() const;
  std::optional<SessionSnapshot> snapshot(BoardId id) const;
  std::optional<std::string> elapsed_text(BoardId id, Clock::time_point now) const;

  // True when every registered session has reached a state its worker will not leave.
  bool all_settled() const;
  std::size_t size() const;

private:
  Cfg cfg_;
  ChannelFactory factory_;

  flashwatch::core::EventChannel<Event> events_;

  mutable std::mutex mtx_;
  std::map<BoardId, std::unique_ptr<BoardSession>> sessions_;
  BoardId next_id_ = 1;
  bool closing_ = false;
};

} // namespace flashwatch::monitor
