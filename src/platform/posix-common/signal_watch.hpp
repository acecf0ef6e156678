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

#include <functional>
#include <optional>
#include <thread>

#include <signal.h>

namespace flashwatch::posix_common {

// Blocks SIGINT, SIGTERM, SIGHUP and SIGQUIT in the calling thread, and in
// every thread it starts afterwards, and reports them from a sigwait thread.
// Enable it before any board session is started. SIGUSR1 is reserved for it.
class SignalWatch {
public:
  using Callback = std::function<void(const char* sig_desc, int count)>;

  SignalWatch() = default;
  ~SignalWatch();

  SignalWatch(const SignalWatch&) = delete;
  SignalWatch& operator=(const SignalWatch&) = delete;

  SignalWatch(SignalWatch&& o) noexcept;
  SignalWatch& operator=(SignalWatch&& o) noexcept;

  static std::optional<SignalWatch> enable(Callback cb);

private:
  explicit SignalWatch(Callback cb);

  void stop_and_restore_() noexcept;

private:
  Callback cb_{};
  std::jthread watcher_{};
  bool active_ = false;

  sigset_t old_mask_{};
  bool have_old_mask_ = false;
};

} // namespace flashwatch::posix_common
