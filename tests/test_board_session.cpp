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

#include "monitor/board_session.hpp"

#include "fake_channel.hpp"

#include <chrono>
#include <cstdio>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int g_pass = 0;
static int g_fail = 0;

template <class T>
static void check_eq(const char* label, T got, T expected) {
  if (got == expected) {
    ++g_pass;
  } else {
    std::fprintf(stderr, "FAIL %s\n", label);
    ++g_fail;
  }
}

using namespace std::chrono_literals;
using flashwatch::core::Errc;
using flashwatch::monitor::Board;
using flashwatch::monitor::BoardSession;
using flashwatch::monitor::Cfg;
using flashwatch::monitor::Event;
using flashwatch::monitor::EventKind;
using flashwatch::monitor::State;
using flashwatch::test::ChannelScript;
using flashwatch::test::FakeChannel;
using flashwatch::test::wait_until;

namespace {

struct EventLog {
  std::mutex mtx;
  std::vector<Event> events;

  BoardSession::Emit sink() {
    return [this](Event ev) {
      std::lock_guard lk(mtx);
      events.push_back(std::move(ev));
    };
  }

  std::vector<Event> copy() {
    std::lock_guard lk(mtx);
    return events;
  }

  std::vector<EventKind> kinds_without_progress() {
    std::vector<EventKind> out;
    for (const auto& e : copy())
      if (e.kind != EventKind::Progress) out.push_back(e.kind);
    return out;
  }
};

Cfg fast_cfg() {
  Cfg cfg;
  cfg.poll_interval = 1ms;
  return cfg;
}

struct Rig {
  std::shared_ptr<ChannelScript> script = std::make_shared<ChannelScript>();
  EventLog log;
  std::unique_ptr<BoardSession> session;

  explicit Rig(const Cfg& cfg = fast_cfg()) {
    session = std::make_unique<BoardSession>(Board{.id = 7, .port = "/dev/ttyFAKE0", .baud = 115200},
                                             std::make_unique<FakeChannel>(script), cfg, log.sink());
  }

  bool wait_state(State s) {
    return wait_until([&] { return session->state() == s; });
  }
};

} // namespace

// ----- completion by marker -----

static void test_marker_flashes_board() {
  Rig rig;
  rig.script->push("U-Boot 2023.04\r\n");
  rig.script->push("Span Gateway 2.0.0 span-gateway ready\n");
  check_eq("marker_start", rig.session->start().ok, true);

  check_eq("marker_settles", rig.wait_state(State::Flashed), true);

  const auto kinds = rig.log.kinds_without_progress();
  const std::vector<EventKind> expected{EventKind::FirstTransmission, EventKind::LineReceived,
                                        EventKind::LineReceived, EventKind::Flashed};
  check_eq("marker_event_order", kinds == expected, true);

  const auto evs = rig.log.copy();
  check_eq("marker_first_line_text", evs.at(1).text, std::string("U-Boot 2023.04"));
  check_eq("marker_flashed_by", evs.back().text, std::string("marker"));
  check_eq("marker_all_board_id", evs.back().board, flashwatch::monitor::BoardId{7});

  const auto snap = rig.session->snapshot();
  check_eq("marker_percent", snap.percent, 100.0);
  check_eq("marker_first_line_at", snap.first_line_at.has_value(), true);

  // Port is released as soon as the board is done, before anyone calls stop().
  check_eq("marker_released", wait_until([&] { return !rig.script->open.load(); }), true);
  check_eq("marker_release_count", rig.script->releases.load(), 1);
  check_eq("marker_worker_done", wait_until([&] { return !rig.session->snapshot().running; }), true);

  rig.session->stop();
  check_eq("marker_terminated", rig.session->state(), State::Terminated);
  check_eq("marker_single_release", rig.script->releases.load(), 1);
}

// Lines after the marker line are still reported, the match happens once.
static void test_marker_latches() {
  Rig rig;
  rig.script->push("Span Gateway 2.0.0 span-gateway\nSpan Gateway 2.0.0 span-gateway\n");
  check_eq("latch_start", rig.session->start().ok, true);
  check_eq("latch_settles", rig.wait_state(State::Flashed), true);

  int flashed = 0, lines = 0;
  for (const auto& e : rig.log.copy()) {
    if (e.kind == EventKind::Flashed) ++flashed;
    if (e.kind == EventKind::LineReceived) ++lines;
  }
  check_eq("latch_one_flashed", flashed, 1);
  check_eq("latch_both_lines", lines, 2);
}

// ----- first transmission -----

static void test_timers_start_on_first_line() {
  Rig rig;
  check_eq("first_start", rig.session->start().ok, true);
  check_eq("first_listening", rig.wait_state(State::Listening), true);
  check_eq("first_no_clock_yet", rig.session->elapsed_text(flashwatch::monitor::Clock::now()),
           std::string("--:--:--.---"));
  check_eq("first_no_events", rig.log.copy().empty(), true);

  rig.script->push("\r\n");
  check_eq("first_active", rig.wait_state(State::Active), true);
  check_eq("first_line_event", wait_until([&] { return rig.log.copy().size() >= 2; }), true);
  check_eq("first_clock_running",
           rig.session->elapsed_text(flashwatch::monitor::Clock::now()) != "--:--:--.---", true);

  const auto evs = rig.log.copy();
  check_eq("first_event_kind", evs.at(0).kind, EventKind::FirstTransmission);
  check_eq("first_empty_line_delivered", evs.at(1).text, std::string());

  rig.session->stop();
}

// ----- lossy decoding -----

static void test_decode_error_is_not_fatal() {
  Rig rig;
  rig.script->push_bytes({'h', 'i', 0xFF, 0xFE, '!', '\n'});
  rig.script->push("still here\n");
  check_eq("decode_start", rig.session->start().ok, true);

  check_eq("decode_both_lines", wait_until([&] {
    int n = 0;
    for (const auto& e : rig.log.copy()) n += e.kind == EventKind::LineReceived;
    return n == 2;
  }), true);

  const auto kinds = rig.log.kinds_without_progress();
  const std::vector<EventKind> expected{EventKind::FirstTransmission, EventKind::DecodeError,
                                        EventKind::LineReceived, EventKind::LineReceived};
  check_eq("decode_event_order", kinds == expected, true);
  check_eq("decode_cleaned_text", rig.log.copy().at(2).text, std::string("hi!"));
  check_eq("decode_still_active", rig.session->state(), State::Active);

  rig.session->stop();
}

// ----- estimate runs out -----

static void test_estimate_reaches_100_without_marker() {
  Cfg cfg = fast_cfg();
  cfg.progress.total = 77ms;
  cfg.progress.tick = 1ms;

  Rig rig(cfg);
  rig.script->push("booting\n");
  check_eq("estimate_start", rig.session->start().ok, true);
  check_eq("estimate_settles", rig.wait_state(State::TimedOut), true);

  const auto evs = rig.log.copy();
  int progress = 0;
  bool monotonic = true;
  double last = 0.0;
  for (const auto& e : evs) {
    if (e.kind != EventKind::Progress) continue;
    ++progress;
    if (e.percent < last) monotonic = false;
    last = e.percent;
  }
  check_eq("estimate_progress_events", progress, 77);
  check_eq("estimate_monotonic", monotonic, true);
  check_eq("estimate_last_100", last, 100.0);
  check_eq("estimate_flashed_kind", evs.back().kind, EventKind::Flashed);
  check_eq("estimate_flashed_by", evs.back().text, std::string("estimate"));
  check_eq("estimate_is_success", flashwatch::monitor::is_success(rig.session->state()), true);

  // Elapsed freezes once the board has settled.
  const auto later = flashwatch::monitor::Clock::now() + 1h;
  check_eq("estimate_clock_frozen", rig.session->elapsed_text(later),
           rig.session->elapsed_text(flashwatch::monitor::Clock::now()));

  rig.session->stop();
}

// ----- port failures -----

static void test_port_open_failure() {
  Rig rig;
  rig.script->open_result = flashwatch::core::Status::Fail(Errc::PortOpen, "/dev/ttyFAKE0: No such file or directory");
  check_eq("open_fail_start", rig.session->start().ok, true);
  check_eq("open_fail_errored", rig.wait_state(State::Errored), true);

  const auto evs = rig.log.copy();
  check_eq("open_fail_one_event", evs.size(), std::size_t{1});
  check_eq("open_fail_kind", evs.at(0).kind, EventKind::PortError);

  const auto snap = rig.session->snapshot();
  check_eq("open_fail_code", snap.last_error.code, Errc::PortOpen);
  check_eq("open_fail_no_first_line", snap.first_line_at.has_value(), false);
  check_eq("open_fail_no_release", rig.script->releases.load(), 0);

  rig.session->stop();
}

static void test_port_io_failure_mid_stream() {
  Rig rig;
  rig.script->push("a\n");
  rig.script->fail_io("/dev/ttyFAKE0: device disconnected");
  check_eq("io_fail_start", rig.session->start().ok, true);
  check_eq("io_fail_errored", rig.wait_state(State::Errored), true);

  const auto kinds = rig.log.kinds_without_progress();
  const std::vector<EventKind> expected{EventKind::FirstTransmission, EventKind::LineReceived, EventKind::PortError};
  check_eq("io_fail_order", kinds == expected, true);
  check_eq("io_fail_code", rig.session->snapshot().last_error.code, Errc::PortIO);
  check_eq("io_fail_released", wait_until([&] { return rig.script->releases.load() == 1; }), true);

  rig.session->stop();
}

// ----- lifecycle -----

static void test_stop_while_listening() {
  Rig rig;
  check_eq("stop_start", rig.session->start().ok, true);
  check_eq("stop_listening", rig.wait_state(State::Listening), true);

  const auto t0 = std::chrono::steady_clock::now();
  rig.session->stop();
  check_eq("stop_fast", std::chrono::steady_clock::now() - t0 < 1s, true);

  check_eq("stop_terminated", rig.session->state(), State::Terminated);
  check_eq("stop_released", rig.script->releases.load(), 1);
  check_eq("stop_not_open", rig.script->open.load(), false);

  // Nothing comes out of a stopped session.
  rig.script->push("late line\n");
  std::this_thread::sleep_for(10ms);
  check_eq("stop_no_events", rig.log.copy().empty(), true);

  rig.session->stop();
  check_eq("stop_twice_release", rig.script->releases.load(), 1);
}

static void test_start_rules() {
  Rig rig;
  check_eq("rules_first_start", rig.session->start().ok, true);
  check_eq("rules_second_start", rig.session->start().ok, false);
  rig.session->stop();
  check_eq("rules_start_after_stop", rig.session->start().ok, false);

  BoardSession orphan(Board{.id = 1, .port = "/dev/null"}, nullptr, fast_cfg(), {});
  check_eq("rules_no_channel", orphan.start().code, Errc::PortOpen);
}

int main() {
  test_marker_flashes_board();
  test_marker_latches();
  test_timers_start_on_first_line();
  test_decode_error_is_not_fatal();
  test_estimate_reaches_100_without_marker();
  test_port_open_failure();
  test_port_io_failure_mid_stream();
  test_stop_while_listening();
  test_start_rules();

  std::fprintf(stdout, "board_session: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
