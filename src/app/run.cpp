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

#include "app/run.hpp"
#include "app/monitor_view.hpp"

#include "monitor/board.hpp"
#include "monitor/session_registry.hpp"
#include "platform/platform_all.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace flashwatch::app {

namespace {

constexpr auto kUiTick = std::chrono::milliseconds(33);

// "ttyUSB0" and "/dev/ttyUSB0" name the same port. Paths sysfs does not know
// (pty links, by-id aliases) are used as given.
std::string resolve_one(const std::string& port) {
  if (auto info = flashwatch::platform::find_by_name(port)) {
    spdlog::info("Using {}", info->describe());
    return info->devnode();
  }
  if (port.find('/') == std::string::npos) return "/dev/" + port;
  return port;
}

std::vector<std::string> resolve_ports(const Options& opt) {
  std::vector<std::string> out;
  if (!opt.ports.empty()) {
    for (const auto& p : opt.ports) out.push_back(resolve_one(p));
    return out;
  }

  for (const auto& p : flashwatch::platform::enumerate_serial_ports()) {
    spdlog::info("Using {}", p.describe());
    out.push_back(p.devnode());
  }
  return out;
}

} // namespace

RunResult list_ports() {
  const auto ports = flashwatch::platform::enumerate_serial_ports();
  if (ports.empty()) {
    spdlog::warn("No serial ports found");
    return RunResult::kNoPorts;
  }
  for (const auto& p : ports) spdlog::info("Found port: {}", p.describe());
  return RunResult::Success;
}

RunResult run(const Options& opt) {
  if (opt.list_ports) return list_ports();

  const auto ports = resolve_ports(opt);
  if (ports.empty()) {
    spdlog::error("No serial ports found. Connect a board or pass --port.");
    return RunResult::kNoPorts;
  }

  MonitorView view(!opt.json, opt.json);
  std::atomic<bool> quit{false};

  // Must exist before the registry so session threads inherit the blocked mask.
  auto watch = flashwatch::platform::SignalWatch::enable([&](const char* sig_desc, int count) {
    quit.store(true, std::memory_order_relaxed);
    view.notice(fmt::format("{} received ({} times), closing ports", sig_desc, count));
  });
  if (!watch) spdlog::warn("Signal handling unavailable; ports may stay claimed on Ctrl+C");

  flashwatch::monitor::SessionRegistry reg(make_cfg(opt));

  std::size_t watching = 0;
  for (const auto& port : ports) {
    auto r = reg.register_board(port);
    if (!r) {
      view.notice(fmt::format("Cannot watch {}: {}", port, r.st.msg));
      continue;
    }
    view.board_added(flashwatch::monitor::Board{.id = r.value, .port = port, .baud = opt.baud});
    ++watching;
  }
  if (!watching) {
    view.fail("No board could be registered");
    return RunResult::kNoPorts;
  }

  bool interrupted = false;
  for (;;) {
    if (quit.load(std::memory_order_relaxed)) { interrupted = true; break; }

    // Sessions emit their final event before settling, so everything is queued by now.
    const bool settled = reg.all_settled();

    if (auto ev = reg.next_event(settled ? std::chrono::milliseconds(0) : kUiTick)) {
      view.event(*ev);
      while (auto more = reg.poll_event()) view.event(*more);
    }
    view.refresh(reg);

    if (settled) break;
  }

  std::size_t failed = 0, passed = 0;
  for (const auto id : reg.ids()) {
    const auto snap = reg.snapshot(id);
    if (!snap) continue;
    if (snap->state == flashwatch::monitor::State::Errored) ++failed;
    else if (flashwatch::monitor::is_success(snap->state)) ++passed;
  }

  reg.stop_all();
  while (auto ev = reg.poll_event()) view.event(*ev);

  if (interrupted) {
    view.fail(fmt::format("Interrupted: {} of {} board(s) passed", passed, watching));
    return RunResult::kInterrupted;
  }
  if (failed) {
    view.fail(fmt::format("{} of {} board(s) reported a port error", failed, watching));
    return RunResult::kBoardFailed;
  }

  view.done(fmt::format("All {} board(s) passed", passed));
  return RunResult::Success;
}

} // namespace flashwatch::app
