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
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace flashwatch::core {

// Many producers, one consumer. Items from a single producer come out in push order.
template <class T>
class EventChannel {
public:
  EventChannel() = default;

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;

  void push(T v) {
    {
      std::lock_guard lk(mtx_);
      q_.push_back(std::move(v));
    }
    cv_.notify_one();
  }

  std::optional<T> try_pop() {
    std::lock_guard lk(mtx_);
    return take_();
  }

  template <class Rep, class Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> wait) {
    std::unique_lock lk(mtx_);
    cv_.wait_for(lk, wait, [&] { return !q_.empty(); });
    return take_();
  }

private:
  std::optional<T> take_() {
    if (q_.empty()) return std::nullopt;
    std::optional<T> out{std::move(q_.front())};
    q_.pop_front();
    return out;
  }

  std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<T> q_;
};

} // namespace flashwatch::core
