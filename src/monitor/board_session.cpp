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

#include "monitor/board_session.hpp"

#include <algorithm>
#include <exception>
#include <system_error>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace flashwatch::monitor {

using flashwatch::core::Errc;
using flashwatch::core::Status;

namespace {

constexpr std::size_t kReadReserve = 4096;

// Releases the port on every way out of the worker: finished, failed, stopped or thrown.
struct ReleaseOnExit {
  flashwatch::core::ISerialChannel& ch;
  ~ReleaseOnExit() { ch.close(); }
};

} // namespace

BoardSession::BoardSession(Board board, std::unique_ptr<flashwatch::core::ISerialChannel> channel,
                           const Cfg& cfg, Emit emit)
    : board_(std::move(board))
    , channel_(std::move(channel))
    , cfg_(cfg)
    , emit_fn_(std::move(emit))
    , decoder_(cfg.max_line_bytes)
    , detector_(cfg.marker)
    , estimator_(cfg.progress) {}

BoardSession::~BoardSession() { stop(); }

Status BoardSession::start() {
  std::lock_guard lk(ctl_mtx_);
  if (stopped_) return Status::Failf("Board {}: session already stopped", board_.id);
  if (started_) return Status::Failf("Board {}: session already started", board_.id);
  if (!channel_) return Status::Failf(Errc::PortOpen, "Board {}: no serial channel", board_.id);

  try {
    running_.store(true, std::memory_order_relaxed);
    worker_ = std::jthread([this](std::stop_token st) { run_(std::move(st)); });
  } catch (const std::system_error& e) {
    running_.store(false, std::memory_order_relaxed);
    return Status::Failf("Board {}: cannot start worker: {}", board_.id, e.what());
  }

  started_ = true;
  spdlog::debug("Board {}: watching {} at {} baud", board_.id, board_.port, board_.baud);
  return Status::Ok();
}

void BoardSession::stop() noexcept {
  std::lock_guard lk(ctl_mtx_);
  if (stopped_) return;
  stopped_ = true;

  if (worker_.joinable()) {
    worker_.request_stop();
    worker_.join();
  }
  if (channel_) channel_->close();

  {
    std::lock_guard slk(mtx_);
    if (!settled_at_) settled_at_ = Clock::now();
    state_ = State::Terminated;
  }
  spdlog::debug("Board {}: stopped", board_.id);
}

void BoardSession::request_stop() noexcept {
  std::lock_guard lk(ctl_mtx_);
  if (!stopped_) worker_.request_stop();
}

State BoardSession::state() const {
  std::lock_guard lk(mtx_);
  return state_;
}

SessionSnapshot BoardSession::snapshot() const {
  std::lock_guard lk(mtx_);
  SessionSnapshot s;
  s.board = board_;
  s.state = state_;
  s.percent = percent_;
  s.running = running_.load(std::memory_order_relaxed);
  s.first_line_at = first_line_at_;
  s.last_error = last_error_;
  return s;
}

std::string BoardSession::elapsed_text(Clock::time_point now) const {
  std::lock_guard lk(mtx_);
  if (!first_line_at_) return "--:--:--.---";

  const auto end = settled_at_ ? std::min(*settled_at_, now) : now;
  if (end <= *first_line_at_) return format_elapsed(std::chrono::milliseconds{0});
  return format_elapsed(std::chrono::duration_cast<std::chrono::milliseconds>(end - *first_line_at_));
}

void BoardSession::run_(std::stop_token st) noexcept {
  ReleaseOnExit release{*channel_};

  Status result;
  try {
    result = loop_(st);
  } catch (const std::exception& e) {
    result = Status::Failf(Errc::PortIO, "{}: monitor failed: {}", board_.port, e.what());
  } catch (...) {
    result = Status::Failf(Errc::PortIO, "{}: monitor failed with an unknown exception", board_.port);
  }

  if (!result.ok) fail_(std::move(result), st);
  running_.store(false, std::memory_order_relaxed);
}

Status BoardSession::loop_(std::stop_token st) {
  auto ost = channel_->open(board_.port, board_.baud);
  if (!ost.ok) {
    if (ost.code == Errc::None) ost.code = Errc::PortOpen;
    return ost;
  }
  set_state_(State::Listening);

  std::vector<std::uint8_t> chunk;
  chunk.reserve(kReadReserve);

  while (!st.stop_requested()) {
    chunk.clear();

    auto pst = channel_->poll_available(chunk);
    if (!pst.ok) {
      if (pst.code == Errc::None) pst.code = Errc::PortIO;
      return pst;
    }

    if (!chunk.empty()) {
      for (const auto& line : decoder_.feed(chunk)) handle_line_(line, st);
    }

    if (!flashed_) service_progress_(Clock::now(), st);
    if (flashed_) break;

    if (!sleep_(st)) break;
  }
  return Status::Ok();
}

void BoardSession::handle_line_(const DecodedLine& line, const std::stop_token& st) {
  const auto now = Clock::now();

  if (!first_line_seen_) {
    first_line_seen_ = true;
    estimator_.start(now);
    {
      std::lock_guard lk(mtx_);
      first_line_at_ = now;
    }
    set_state_(State::Active);
    emit_(st, EventKind::FirstTransmission);
  }

  if (line.dropped) {
    const auto err = Status::Failf(Errc::Decode, "Dropped {} undecodable byte sequence(s)", line.dropped);
    spdlog::debug("Board {}: {} [{}]", board_.id, err.msg, flashwatch::core::errc_name(err.code));
    emit_(st, EventKind::DecodeError, err.msg);
  }

  emit_(st, EventKind::LineReceived, line.text);

  if (!flashed_ && detector_.matches(line.text)) {
    estimator_.complete();
    publish_percent_(estimator_.percent());
    emit_(st, EventKind::Progress, {}, estimator_.percent());
    finish_(State::Flashed, kFlashedByMarker, st);
  }
}

void BoardSession::service_progress_(Clock::time_point now, const std::stop_token& st) {
  if (!estimator_.started() || estimator_.finished()) return;

  const auto due = estimator_.ticks_due(now);
  while (estimator_.ticks() < due) {
    const auto step = estimator_.tick();
    if (step == ProgressEstimator::Step::Ignored) break;

    publish_percent_(estimator_.percent());
    emit_(st, EventKind::Progress, {}, estimator_.percent());

    if (step == ProgressEstimator::Step::Finished) {
      spdlog::info("Board {}: estimated flash time elapsed without the completion marker", board_.id);
      finish_(State::TimedOut, kFlashedByEstimate, st);
      break;
    }
  }
}

void BoardSession::finish_(State s, std::string_view how, const std::stop_token& st) {
  if (flashed_) return;
  flashed_ = true;

  // Event first, so a settled state implies the event is already queued.
  spdlog::info("Board {}: flashed ({})", board_.id, how);
  emit_(st, EventKind::Flashed, std::string(how));
  set_state_(s);
}

void BoardSession::fail_(Status err, const std::stop_token& st) {
  spdlog::error("Board {}: {}", board_.id, err.msg);

  std::string msg = err.msg;
  {
    std::lock_guard lk(mtx_);
    last_error_ = std::move(err);
  }
  emit_(st, EventKind::PortError, std::move(msg));
  set_state_(State::Errored);
}

bool BoardSession::emit_(const std::stop_token& st, EventKind kind, std::string text, double percent) {
  if (st.stop_requested() || !emit_fn_) return false;

  Event ev;
  ev.kind = kind;
  ev.board = board_.id;
  ev.text = std::move(text);
  ev.percent = percent;
  ev.at = Clock::now();
  emit_fn_(std::move(ev));
  return true;
}

void BoardSession::set_state_(State s) {
  State old;
  {
    std::lock_guard lk(mtx_);
    if (state_ == State::Terminated || state_ == s) return;
    old = state_;
    state_ = s;
    if (is_settled(s) && !settled_at_) settled_at_ = Clock::now();
  }
  spdlog::debug("Board {}: {} -> {}", board_.id, state_name(old), state_name(s));
}

void BoardSession::publish_percent_(double p) {
  std::lock_guard lk(mtx_);
  if (p > percent_) percent_ = std::min(p, 100.0);
}

bool BoardSession::sleep_(const std::stop_token& st) {
  std::unique_lock lk(sleep_mtx_);
  sleep_cv_.wait_for(lk, st, cfg_.poll_interval, [] { return false; });
  return !st.stop_requested();
}

} // namespace flashwatch::monitor
