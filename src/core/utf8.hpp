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
#include <string>
#include <string_view>

namespace flashwatch::core {

namespace detail {

constexpr bool u8_cont(unsigned char c) noexcept { return (c & 0xC0) == 0x80; }

} // namespace detail

// Sequence length announced by a lead byte, or 0 if c cannot start one.
constexpr std::size_t u8_lead_len(unsigned char c) noexcept {
  if (c < 0x80) return 1;
  if (c >= 0xC2 && c <= 0xDF) return 2;
  if (c >= 0xE0 && c <= 0xEF) return 3;
  if (c >= 0xF0 && c <= 0xF4) return 4;
  return 0;
}

// Where to cut s so that a sequence still missing bytes at its end stays
// whole in the next piece. Returns s.size() when the tail is complete or
// not UTF-8 at all.
constexpr std::size_t u8_cut_point(std::string_view s) noexcept {
  if (s.empty()) return 0;

  std::size_t j = s.size() - 1;
  while (j > 0 && s.size() - j < 4 && detail::u8_cont(static_cast<unsigned char>(s[j]))) --j;

  const std::size_t need = u8_lead_len(static_cast<unsigned char>(s[j]));
  if (j > 0 && need > s.size() - j) return j;
  return s.size();
}

// Length of the well-formed UTF-8 sequence starting at s[i], or 0 if the bytes
// there are not one (Unicode table 3-7: no overlongs, surrogates or > U+10FFFF).
constexpr std::size_t u8_valid_len(std::string_view s, std::size_t i) noexcept {
  const auto at = [&](std::size_t k) { return static_cast<unsigned char>(s[k]); };
  const std::size_t left = s.size() - i;
  const unsigned char c = at(i);

  if (c < 0x80) return 1;

  unsigned char lo = 0x80, hi = 0xBF;
  std::size_t n = 0;
  if (c >= 0xC2 && c <= 0xDF) {
    n = 2;
  } else if (c >= 0xE0 && c <= 0xEF) {
    n = 3;
    if (c == 0xE0) lo = 0xA0;
    if (c == 0xED) hi = 0x9F;
  } else if (c >= 0xF0 && c <= 0xF4) {
    n = 4;
    if (c == 0xF0) lo = 0x90;
    if (c == 0xF4) hi = 0x8F;
  } else {
    return 0;
  }

  if (left < n) return 0;
  if (at(i + 1) < lo || at(i + 1) > hi) return 0;
  for (std::size_t k = 2; k < n; ++k)
    if (!detail::u8_cont(at(i + k))) return 0;
  return n;
}

// Appends the valid parts of s to out. Each run of undecodable bytes is dropped
// and counted once.
inline std::size_t u8_sanitize(std::string_view s, std::string& out) {
  std::size_t dropped = 0;
  bool in_bad = false;

  out.reserve(out.size() + s.size());
  for (std::size_t i = 0; i < s.size();) {
    const std::size_t n = u8_valid_len(s, i);
    if (!n) {
      if (!in_bad) ++dropped;
      in_bad = true;
      ++i;
      continue;
    }
    in_bad = false;
    out.append(s.substr(i, n));
    i += n;
  }
  return dropped;
}

} // namespace flashwatch::core
