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

#include "core/status.hpp"
#include "monitor/cfg.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace flashwatch::app {

struct Options {
    bool help = false;
    bool version = false;
    bool list_ports = false;
    bool json = false; // one BOARDEVENT{...} line per event, for a GUI front end

    // Empty = every serial port found in sysfs, like the old "Add Board" button.
    std::vector<std::string> ports;

    int baud = flashwatch::monitor::kDefaultBaud;
    std::string marker{flashwatch::monitor::kCompletionMarker};

    std::chrono::milliseconds duration{770'000};
    std::chrono::milliseconds tick{10'000};
    std::chrono::milliseconds poll{100};
};

flashwatch::core::Result<Options> parse_cli(int argc, char** argv) noexcept;
std::string usage_text();

flashwatch::monitor::Cfg make_cfg(const Options& opt);

} // namespace flashwatch::app
