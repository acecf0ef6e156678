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

#include "platform/posix-common/signal_watch.hpp"

#include <pthread.h>
#include <signal.h>

#include <cstring>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace flashwatch::posix_common {

namespace {

// Private to the watcher: sent with pthread_kill to end its sigwait.
constexpr int kWakeSignal = SIGUSR1;

constexpr int kWatched[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT};

sigset_t watched_set(bool with_wake) {
  sigset_t set{};
  sigemptyset(&set);
  for (const int s : kWatched) sigaddset(&set, s);
  if (with_wake) sigaddset(&set, kWakeSignal);
  return set;
}

const char* sig_desc(int signo) {
  switch (signo) {
    case SIGINT: return "SIGINT";
    case SIGTERM: return "SIGTERM";
    case SIGHUP: return "SIGHUP";
    case SIGQUIT: return "SIGQUIT";
    default: return "SIGNAL";
  }
}

void watch_loop(std::stop_token st, SignalWatch::Callback cb) {
  const sigset_t waitset = watched_set(true);
  int count = 0;

  while (!st.stop_requested()) {
    int signo = 0;
    if (::sigwait(&waitset, &signo) != 0) continue;
    if (signo == kWakeSignal) continue;

    ++count;
    spdlog::debug("Received {} ({} so far)", sig_desc(signo), count);
    if (cb) cb(sig_desc(signo), count);
  }
}

} // namespace

SignalWatch::SignalWatch(Callback cb) : cb_(std::move(cb)) {}

SignalWatch::~SignalWatch() { stop_and_restore_(); }

SignalWatch::SignalWatch(SignalWatch&& o) noexcept { *this = std::move(o); }

SignalWatch& SignalWatch::operator=(SignalWatch&& o) noexcept {
  if (this == &o) return *this;

  stop_and_restore_();

  cb_ = std::move(o.cb_);
  watcher_ = std::move(o.watcher_);
  active_ = std::exchange(o.active_, false);
  old_mask_ = o.old_mask_;
  have_old_mask_ = std::exchange(o.have_old_mask_, false);
  return *this;
}

void SignalWatch::stop_and_restore_() noexcept {
  if (active_ && watcher_.joinable()) {
    watcher_.request_stop();
    const int rc = ::pthread_kill(watcher_.native_handle(), kWakeSignal);
    if (rc != 0) {
      spdlog::error("Cannot wake signal watcher: {}", std::strerror(rc));
      watcher_.detach();
    } else {
      watcher_.join();
    }
  }
  active_ = false;

  if (have_old_mask_) {
    // A termination signal that arrived after the watcher left is delivered here.
    (void)::pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    have_old_mask_ = false;
  }
}

std::optional<SignalWatch> SignalWatch::enable(Callback cb) {
  const sigset_t set = watched_set(true);

  sigset_t old{};
  const int rc = ::pthread_sigmask(SIG_BLOCK, &set, &old);
  if (rc != 0) {
    spdlog::warn("Cannot block termination signals: {}", std::strerror(rc));
    return std::nullopt;
  }

  SignalWatch sw(std::move(cb));
  sw.old_mask_ = old;
  sw.have_old_mask_ = true;

  try {
    sw.watcher_ = std::jthread(watch_loop, sw.cb_);
  } catch (const std::system_error& e) {
    spdlog::warn("Cannot start signal watcher: {}", e.what());
    return std::nullopt;
  }
  sw.active_ = true;

  return std::optional<SignalWatch>{std::move(sw)};
}

} // namespace flashwatch::posix_common
