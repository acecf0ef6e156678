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

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace flashwatch::monitor {

using BoardId = std::uint32_t;
using Clock = std::chrono::steady_clock;

inline constexpr int kDefaultBaud = 115200;

struct Board {
  BoardId id = 0;
  std::string port;
  int baud = kDefaultBaud;
};

enum class State : std::uint8_t {
  Idle,
  Listening,
  Active,
  Flashed,
  TimedOut,
  Errored,
  Terminated,
};

constexpr std::string_view state_name(State s) noexcept {
  switch (s) {
    case State::Idle: return "IDLE";
    case State::Listening: return "LISTEN";
    case State::Active: return "ACTIVE";
    case State::Flashed: return "FLASHED";
    case State::TimedOut: return "TIMEOUT";
    case State::Errored: return "ERROR";
    case State::Terminated: return "STOPPED";
  }
  return "?";
}

// Flashed, TimedOut and Errored end the read loop; only stop() leaves them.
constexpr bool is_settled(State s) noexcept {
  return s == State::Flashed || s == State::TimedOut || s == State::Errored || s == State::Terminated;
}

constexpr bool is_success(State s) noexcept { return s == State::Flashed || s == State::TimedOut; }

enum class EventKind : std::uint8_t {
  LineReceived,
  DecodeError,
  PortError,
  FirstTransmission,
  Flashed,
  Progress,
};

constexpr std::string_view event_name(EventKind k) noexcept {
  switch (k) {
    case EventKind::LineReceived: return "line";
    case EventKind::DecodeError: return "decode_error";
    case EventKind::PortError: return "port_error";
    case EventKind::FirstTransmission: return "first_transmission";
    case EventKind::Flashed: return "flashed";
    case EventKind::Progress: return "progress";
  }
  return "?";
}

// How a board got to Flashed; carried as the text of the Flashed event.
inline constexpr std::string_view kFlashedByMarker = "marker";
inline constexpr std::string_view kFlashedByEstimate = "estimate";

struct Event {
  EventKind kind = EventKind::LineReceived;
  BoardId board = 0;
  std::string text;
  double percent = 0.0;
  Clock::time_point at{};
};

} // namespace flashwatch::monitor
