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

#include "monitor/line_decoder.hpp"

#include "core/str.hpp"
#include "core/utf8.hpp"

namespace flashwatch::monitor {

LineDecoder::LineDecoder(std::size_t max_line_bytes)
    : max_line_bytes_(max_line_bytes ? max_line_bytes : kDefaultMaxLineBytes) {}

DecodedLine LineDecoder::decode_(std::string_view raw) {
  DecodedLine out;
  std::string clean;
  out.dropped = flashwatch::core::u8_sanitize(raw, clean);
  out.text = std::string(flashwatch::core::trim(clean));
  return out;
}

std::vector<DecodedLine> LineDecoder::feed(std::span<const std::uint8_t> bytes) {
  std::vector<DecodedLine> lines;

  for (const auto b : bytes) {
    if (b == '\n') {
      // The line already went out at the length limit; this is its own terminator.
      if (!(just_cut_ && (buf_.empty() || buf_ == "\r"))) lines.push_back(decode_(buf_));
      buf_.clear();
      just_cut_ = false;
      continue;
    }

    if (just_cut_ && !(b == '\r' && buf_.empty())) just_cut_ = false;

    buf_.push_back(static_cast<char>(b));
    if (buf_.size() >= max_line_bytes_) {
      const std::size_t cut = flashwatch::core::u8_cut_point(buf_);
      lines.push_back(decode_(std::string_view(buf_).substr(0, cut)));
      buf_.erase(0, cut);
      just_cut_ = buf_.empty();
    }
  }
  return lines;
}

} // namespace flashwatch::monitor
