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

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flashwatch::monitor {

inline constexpr std::size_t kDefaultMaxLineBytes = 4096;

struct DecodedLine {
  std::string text;
  std::size_t dropped = 0; // undecodable byte runs removed from this line
};

// Splits a byte stream on '\n' and decodes each line as UTF-8, lossily:
// invalid sequences are dropped, never fatal. Lines are trimmed, so "\r\n"
// endings come out clean. A line longer than max_line_bytes is cut there,
// moved back so no multi-byte character is split; a newline right after
// such a cut does not produce an extra empty line.
class LineDecoder {
public:
  explicit LineDecoder(std::size_t max_line_bytes = kDefaultMaxLineBytes);

  std::vector<DecodedLine> feed(std::span<const std::uint8_t> bytes);

  std::size_t pending() const noexcept { return buf_.size(); }
  void reset() noexcept {
    buf_.clear();
    just_cut_ = false;
  }

private:
  static DecodedLine decode_(std::string_view raw);

  std::string buf_;
  std::size_t max_line_bytes_;
  bool just_cut_ = false;
};

} // namespace flashwatch::monitor
