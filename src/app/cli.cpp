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
#include "app/version.hpp"

#include "platform/platform_all.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <optional>
#include <string_view>
#include <utility>

namespace flashwatch::app {

using flashwatch::core::Errc;
using flashwatch::core::Result;

static bool is_opt(std::string_view a, std::string_view opt) {
  return a == opt || (a.size() > opt.size() + 1 && a.starts_with(opt) && a[opt.size()] == '=');
}

static std::optional<std::string_view> opt_value(std::string_view a, std::string_view opt) {
  if (a == opt) return std::nullopt;
  if (a.starts_with(opt) && a.size() > opt.size() + 1 && a[opt.size()] == '=') return a.substr(opt.size() + 1);
  return std::nullopt;
}

static Result<std::string_view> read_string_value(int& i, int argc, char** argv,
                                                  std::string_view a, std::string_view opt) noexcept
{
  if (auto ov = opt_value(a, opt)) return Result<std::string_view>::Ok(*ov);
  if (i + 1 >= argc) return Result<std::string_view>::Fail(Errc::Usage, std::string(opt) + " requires value");
  return Result<std::string_view>::Ok(std::string_view(argv[++i]));
}

static Result<long long> read_int_value(int& i, int argc, char** argv,
                                        std::string_view a, std::string_view opt,
                                        long long lo, long long hi) noexcept
{
  auto vr = read_string_value(i, argc, argv, a, opt);
  if (!vr) return Result<long long>::Fail(std::move(vr.st));

  const std::string_view s = vr.value;
  long long v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (ec != std::errc{} || ptr != s.data() + s.size())
    return Result<long long>::Failf(Errc::Usage, "{} expects an integer, got '{}'", opt, s);
  if (v < lo || v > hi)
    return Result<long long>::Failf(Errc::Usage, "{} must be between {} and {}", opt, lo, hi);
  return Result<long long>::Ok(v);
}

std::string usage_text() {
  std::string out;
  out.reserve(2048);

  out += "flashwatch v";
  out += flashwatch::app::version_string();
  out += "\n\n";

  out += R"(Usage:
  flashwatch [--port <dev>]... [--baud <n>] [options]
  flashwatch --list-ports
  flashwatch --help | --version

Watches the serial console of every board being flashed, one worker per port.
A board is reported as flashed when it prints the completion marker.

Options:
  --help, -h
  --version
  --list-ports                 print the serial ports that would be watched and exit
  --port, -p <dev>             watch this port (repeatable). Default: every serial port found
  --baud, -b <n>               line speed for all ports (default 115200)
  --marker <text>              completion marker (default "Span Gateway 2.0.0 span-gateway")
  --duration <sec>             assumed flash time for the progress estimate (default 770)
  --tick <sec>                 progress estimate step (default 10)
  --poll-ms <ms>               serial poll interval (default 100)
  --json                       machine-readable output, one BOARDEVENT{...} line per event
  --verbose, -v                enable verbose logging

Progress is an ESTIMATE: it starts at the first line a board prints and grows
linearly to 100% over --duration, whatever the board does. A board that reaches
100% without printing the marker is still reported as passed, marked "estimate".
)";
  return out;
}

Result<Options> parse_cli(int argc, char** argv) noexcept {
  Options o;

  for (int i = 1; i < argc; ++i) {
    std::string_view a = argv[i];

    if (a == "--help" || a == "-h") { o.help = true; continue; }
    if (a == "--version") { o.version = true; continue; }
    if (a == "--list-ports") { o.list_ports = true; continue; }
    if (a == "--json") { o.json = true; continue; }

    if (a == "--verbose" || a == "-v") {
      spdlog::set_level(spdlog::level::debug);
      continue;
    }

    if (a == "-p" || is_opt(a, "--port")) {
      auto vr = read_string_value(i, argc, argv, a, a == "-p" ? "-p" : "--port");
      if (!vr) return Result<Options>::Fail(std::move(vr.st));
      std::string port(vr.value);
      if (port.empty()) return Result<Options>::Fail(Errc::Usage, "--port requires a device path");
      if (std::find(o.ports.begin(), o.ports.end(), port) != o.ports.end())
        return Result<Options>::Failf(Errc::Usage, "Port given twice: {}", port);
      o.ports.push_back(std::move(port));
      continue;
    }

    if (a == "-b" || is_opt(a, "--baud")) {
      auto vr = read_int_value(i, argc, argv, a, a == "-b" ? "-b" : "--baud", 1, 4'000'000);
      if (!vr) return Result<Options>::Fail(std::move(vr.st));
      o.baud = static_cast<int>(vr.value);
      continue;
    }

    if (is_opt(a, "--marker")) {
      auto vr = read_string_value(i, argc, argv, a, "--marker");
      if (!vr) return Result<Options>::Fail(std::move(vr.st));
      o.marker = std::string(vr.value);
      continue;
    }

    if (is_opt(a, "--duration")) {
      auto vr = read_int_value(i, argc, argv, a, "--duration", 1, 24 * 3600);
      if (!vr) return Result<Options>::Fail(std::move(vr.st));
      o.duration = std::chrono::seconds(vr.value);
      continue;
    }

    if (is_opt(a, "--tick")) {
      auto vr = read_int_value(i, argc, argv, a, "--tick", 1, 3600);
      if (!vr) return Result<Options>::Fail(std::move(vr.st));
      o.tick = std::chrono::seconds(vr.value);
      continue;
    }

    if (is_opt(a, "--poll-ms")) {
      auto vr = read_int_value(i, argc, argv, a, "--poll-ms", 1, 10'000);
      if (!vr) return Result<Options>::Fail(std::move(vr.st));
      o.poll = std::chrono::milliseconds(vr.value);
      continue;
    }

    if (a.starts_with("-")) {
      return Result<Options>::Fail(Errc::Usage, "Unknown option: " + std::string(a));
    }

    return Result<Options>::Fail(Errc::Usage, "Positional arguments are not supported: " + std::string(a));
  }

  if (o.list_ports && !o.ports.empty()) return Result<Options>::Fail(Errc::Usage, "--list-ports cannot be combined with --port");
  if (o.marker.empty()) return Result<Options>::Fail(Errc::Usage, "--marker cannot be empty");
  if (o.tick > o.duration) return Result<Options>::Fail(Errc::Usage, "--tick cannot be longer than --duration");
  if (!flashwatch::platform::TtySerial::baud_to_speed(o.baud))
    return Result<Options>::Failf(Errc::Usage, "Unsupported baud rate: {}", o.baud);

  return Result<Options>::Ok(std::move(o));
}

flashwatch::monitor::Cfg make_cfg(const Options& opt) {
  flashwatch::monitor::Cfg cfg;
  cfg.baud = opt.baud;
  cfg.poll_interval = opt.poll;
  cfg.progress.total = opt.duration;
  cfg.progress.tick = opt.tick;
  cfg.marker = opt.marker;
  return cfg;
}

} // namespace flashwatch::app
