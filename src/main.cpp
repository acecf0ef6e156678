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

#include "app/cli.hpp"
#include "app/run.hpp"
#include "app/version.hpp"

#include <cstdlib>
#include <exception>

#include <spdlog/spdlog.h>

int main(int argc, char **argv) {
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

  try {
    auto opt = flashwatch::app::parse_cli(argc, argv);
    if (!opt) {
      spdlog::error("{}", opt.st.msg);
      spdlog::error("Failed to parse command line arguments. Use --help to see usage.");
      return static_cast<int>(flashwatch::app::RunResult::kUsage);
    }

    if (opt.value.json) {
      // Lines on stdout are BOARDEVENT records; keep the log lines short so a
      // front end can show them as they are.
      spdlog::set_pattern("%H:%M:%S %v");
    }
    if (opt.value.help) {
      spdlog::info(flashwatch::app::usage_text());
      return EXIT_SUCCESS;
    }
    if (opt.value.version) {
      spdlog::info("flashwatch v{}", flashwatch::app::version_string());
      return EXIT_SUCCESS;
    }

    const auto ret = flashwatch::app::run(opt.value);
    return ret == flashwatch::app::RunResult::Success ? EXIT_SUCCESS : static_cast<int>(ret);
  } catch (const std::exception &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
}
