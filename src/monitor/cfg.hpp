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

#include "monitor/board.hpp"
#include "monitor/completion.hpp"
#include "monitor/line_decoder.hpp"
#include "monitor/progress.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace flashwatch::monitor {

struct Cfg {
    int baud = kDefaultBaud;

    // Sleep between polls of the port; also the worst-case stop latency.
    std::chrono::milliseconds poll_interval{100};

    ProgressCfg progress{};

    std::string marker{kCompletionMarker};
    std::size_t max_line_bytes = kDefaultMaxLineBytes;
};

} // namespace flashwatch::monitor
