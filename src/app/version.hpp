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

#include <string>
#include <string_view>

// Set from project(VERSION) by the build; the fallback keeps ad-hoc builds working.
#ifndef FLASHWATCH_VERSION
#define FLASHWATCH_VERSION "0.2.0"
#endif

// Optional build tag, e.g. -DFLASHWATCH_BUILD_TAG="bench-3".
#ifndef FLASHWATCH_BUILD_TAG
#define FLASHWATCH_BUILD_TAG ""
#endif

namespace flashwatch::app {

inline const std::string& version_string() {
    static const std::string v = [] {
        std::string s = FLASHWATCH_VERSION;
        constexpr std::string_view tag = FLASHWATCH_BUILD_TAG;
        if (!tag.empty()) {
            s += "+";
            s += tag;
        }
        return s;
    }();
    return v;
}

} // namespace flashwatch::app
