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

#include "core/str.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace flashwatch::monitor {

// Printed by the gateway image once it boots from the freshly written flash.
inline constexpr std::string_view kCompletionMarker = "Span Gateway 2.0.0 span-gateway";

class CompletionDetector {
public:
  CompletionDetector() = default;
  explicit CompletionDetector(std::string marker) : marker_(std::move(marker)) {}

  // Case-sensitive substring match. Holds no state; the session latches the result.
  bool matches(std::string_view line) const noexcept {
    return !marker_.empty() && flashwatch::core::contains(line, marker_);
  }

  const std::string& marker() const noexcept { return marker_; }

private:
  std::string marker_{kCompletionMarker};
};

} // namespace flashwatch::monitor
