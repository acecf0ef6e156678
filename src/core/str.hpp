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

constexpr bool is_ascii_space(unsigned char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

constexpr std::string_view trim(std::string_view s) noexcept {
    while (!s.empty() && is_ascii_space(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && is_ascii_space(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
    return s;
}

constexpr bool contains(std::string_view s, std::string_view needle) noexcept {
    return s.find(needle) != std::string_view::npos;
}

// Text safe to put on a terminal row: escape sequences (CSI, OSC and the
// two-byte forms) and other control bytes are removed, tabs become spaces.
// Bytes >= 0x80 pass through untouched.
inline std::string printable(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    std::size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c != 0x1B) {
            if (c == '\t') out.push_back(' ');
            else if (c >= 0x20 && c != 0x7F) out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        if (++i >= s.size()) break;
        const char kind = s[i++];
        if (kind == '[') {
            // parameters and intermediates, then one final byte in 0x40..0x7E
            while (i < s.size()) {
                const auto p = static_cast<unsigned char>(s[i++]);
                if (p >= 0x40 && p <= 0x7E) break;
            }
        } else if (kind == ']') {
            // ends at BEL or ST (ESC '\')
            while (i < s.size()) {
                if (s[i] == '\a') { ++i; break; }
                if (s[i] == '\x1B' && i + 1 < s.size() && s[i + 1] == '\\') { i += 2; break; }
                ++i;
            }
        }
    }
    return out;
}

} // namespace flashwatch::core
