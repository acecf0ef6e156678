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

#include "core/serial_channel.hpp"
#include "core/status.hpp"
#include "monitor/board.hpp"
#include "monitor/cfg.hpp"
#include "monitor/completion.hpp"
#include "monitor/line_decoder.hpp"
#include "monitor/progress.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace flashwatch::monitor {

struct SessionSnapshot {
  Board board;
  State state = State::Idle;
  double percent = 0.0;
  bool running = false;
  std::optional<Clock::time_point> first_line_at;
  flashwatch::core::Status last_error{};
};

// Watches one board on its own thread:
//   Idle -> Listening (port open) -> Active (first line) -> Flashed | TimedOut | Errored
// and any state -> Terminated on stop(). Events go out through `emit`, in the
// order they happen, from the worker thread only.
class BoardSession {
public:
  using Emit = std::function<void(Event)>;

  BoardSession(Board board, std::unique_ptr<flashwatch::core::ISerialChannel> channel, const Cfg& cfg, Emit emit);
  ~BoardSession();

  BoardSession(const BoardSession&) = delete;
  BoardSession& operator=(const BoardSession&) = delete;

  flashwatch::core::Status start();

  // Requests stop, joins the worker and releases the port. Blocks for at most
  // about one poll interval. Safe to call repeatedly.
  void stop() noexcept;

  // Non-blocking half of stop(), so many sessions can wind down in parallel.
  void request_stop() noexcept;

  const Board& board() const noexcept { return board_; }
  State state() const;
  SessionSnapshot snapshot() const;

  // Time since the first line, frozen once the board settles.
  std::string elapsed_text(Clock::time_point now) const;

private:
  void run_(std::stop_token st) noexcept;
  flashwatch::core::Status loop_(std::stop_token st);

  void handle_line_(const DecodedLine& line, const std::stop_token& st);
  void service_progress_(Clock::time_point now, const std::stop_token& st);
  void finish_(State s, std::string_view how, const std::stop_token& st);
  void fail_(flashwatch::core::Status err, const std::stop_token& st);

  bool emit_(const std::stop_token& st, EventKind kind, std::string text = {}, double percent = 0.0);
  void set_state_(State s);
  void publish_percent_(double p);
  bool sleep_(const std::stop_token& st);

  Board board_;
  std::unique_ptr<flashwatch::core::ISerialChannel> channel_;
  Cfg cfg_;
  Emit emit_fn_;

  // Worker-only.
  LineDecoder decoder_;
  CompletionDetector detector_;
  ProgressEstimator estimator_;
  bool first_line_seen_ = false;
  bool flashed_ = false;

  mutable std::mutex mtx_;
  State state_ = State::Idle;
  double percent_ = 0.0;
  std::optional<Clock::time_point> first_line_at_;
  std::optional<Clock::time_point> settled_at_;
  flashwatch::core::Status last_error_{};

  std::atomic_bool running_{false};

  std::mutex sleep_mtx_;
  std::condition_variable_any sleep_cv_;

  std::mutex ctl_mtx_;
  bool started_ = false;
  bool stopped_ = false;
  std::jthread worker_;
};

} // namespace flashwatch::monitor
