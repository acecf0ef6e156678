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

#include "monitor/session_registry.hpp"

#include "fake_channel.hpp"

#include <chrono>
#include <cstdio>
#include <deque>
#include <memory>
#include <set>
#include <string>
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
using flashwatch::monitor::BoardId;
using flashwatch::monitor::Cfg;
using flashwatch::monitor::Event;
using flashwatch::monitor::EventKind;
using flashwatch::monitor::SessionRegistry;
using flashwatch::monitor::State;
using flashwatch::test::ChannelScript;
using flashwatch::test::FakeChannel;
using flashwatch::test::wait_until;

namespace {

// Hands each registered board the next prepared script, or a silent one.
struct Bench {
  std::deque<std::shared_ptr<ChannelScript>> prepared;
  std::vector<std::shared_ptr<ChannelScript>> handed_out;

  std::shared_ptr<ChannelScript> prepare() {
    auto s = std::make_shared<ChannelScript>();
    prepared.push_back(s);
    return s;
  }

  SessionRegistry::ChannelFactory factory() {
    return [this]() -> std::unique_ptr<flashwatch::core::ISerialChannel> {
      std::shared_ptr<ChannelScript> s;
      if (!prepared.empty()) {
        s = prepared.front();
        prepared.pop_front();
      } else {
        s = std::make_shared<ChannelScript>();
      }
      handed_out.push_back(s);
      return std::make_unique<FakeChannel>(s);
    };
  }
};

Cfg fast_cfg() {
  Cfg cfg;
  cfg.poll_interval = 1ms;
  return cfg;
}

std::vector<Event> drain(SessionRegistry& reg) {
  std::vector<Event> out;
  while (auto ev = reg.poll_event()) out.push_back(std::move(*ev));
  return out;
}

} // namespace

// ----- ids -----

static void test_ids_unique_and_not_reused() {
  Bench bench;
  SessionRegistry reg(fast_cfg(), bench.factory());

  auto a = reg.register_board("/dev/ttyFAKE0");
  auto b = reg.register_board("/dev/ttyFAKE1");
  check_eq("ids_ok", a && b, true);
  check_eq("ids_start_at_one", a.value, BoardId{1});
  check_eq("ids_distinct", b.value, BoardId{2});

  check_eq("ids_stop_one", reg.stop_board(a.value).ok, true);
  check_eq("ids_size_after_stop", reg.size(), std::size_t{1});

  auto c = reg.register_board("/dev/ttyFAKE0");
  check_eq("ids_not_reused", c.value, BoardId{3});

  std::set<BoardId> live;
  for (auto id : reg.ids()) live.insert(id);
  check_eq("ids_live", live == std::set<BoardId>{2, 3}, true);
}

static void test_register_rejects_bad_input() {
  Bench bench;
  SessionRegistry reg(fast_cfg(), bench.factory());

  auto empty = reg.register_board("");
  check_eq("bad_empty_port", empty.st.code, Errc::Usage);
  auto baud = reg.register_board("/dev/ttyFAKE0", 0);
  check_eq("bad_baud", baud.st.code, Errc::Usage);
  check_eq("bad_nothing_added", reg.size(), std::size_t{0});
}

static void test_stop_unknown_board() {
  Bench bench;
  SessionRegistry reg(fast_cfg(), bench.factory());
  const auto st = reg.stop_board(42);
  check_eq("unknown_fails", st.ok, false);
  check_eq("unknown_code", st.code, Errc::Usage);
}

// ----- isolation between boards -----

static void test_boards_are_independent() {
  Bench bench;
  auto good = bench.prepare();
  auto bad = bench.prepare();
  good->push("U-Boot\n");
  good->push("Span Gateway 2.0.0 span-gateway\n");
  bad->push("boot\n");
  bad->fail_io("/dev/ttyFAKE1: device disconnected");

  SessionRegistry reg(fast_cfg(), bench.factory());
  auto g = reg.register_board("/dev/ttyFAKE0");
  auto b = reg.register_board("/dev/ttyFAKE1");
  check_eq("indep_registered", g && b, true);

  check_eq("indep_settled", wait_until([&] { return reg.all_settled(); }), true);
  check_eq("indep_good_flashed", reg.snapshot(g.value)->state, State::Flashed);
  check_eq("indep_bad_errored", reg.snapshot(b.value)->state, State::Errored);
  check_eq("indep_bad_code", reg.snapshot(b.value)->last_error.code, Errc::PortIO);
  check_eq("indep_good_no_error", reg.snapshot(g.value)->last_error.ok, true);

  int good_lines = 0, good_flashed = 0, good_errors = 0, bad_errors = 0;
  for (const auto& e : drain(reg)) {
    if (e.board == g.value) {
      good_lines += e.kind == EventKind::LineReceived;
      good_flashed += e.kind == EventKind::Flashed;
      good_errors += e.kind == EventKind::PortError;
    } else if (e.board == b.value && e.kind == EventKind::PortError) {
      ++bad_errors;
    }
  }
  check_eq("indep_good_lines", good_lines, 2);
  check_eq("indep_good_flashed_once", good_flashed, 1);
  check_eq("indep_good_no_port_error", good_errors, 0);
  check_eq("indep_bad_one_error", bad_errors, 1);
}

// Events of one board come out in the order that board produced them.
static void test_per_board_order() {
  Bench bench;
  auto s = bench.prepare();
  s->push("one\ntwo\nthree\n");

  SessionRegistry reg(fast_cfg(), bench.factory());
  auto id = reg.register_board("/dev/ttyFAKE0");
  check_eq("order_registered", id.st.ok, true);

  std::vector<std::string> lines;
  check_eq("order_all_lines", wait_until([&] {
    while (auto ev = reg.next_event(1ms))
      if (ev->kind == EventKind::LineReceived) lines.push_back(ev->text);
    return lines.size() >= 3;
  }), true);
  check_eq("order_lines", lines == std::vector<std::string>{"one", "two", "three"}, true);
}

// ----- shutdown -----

static void test_stop_all_releases_every_port() {
  Bench bench;
  SessionRegistry reg(fast_cfg(), bench.factory());
  for (int i = 0; i < 4; ++i) {
    auto r = reg.register_board("/dev/ttyFAKE" + std::to_string(i));
    check_eq("stopall_registered", r.st.ok, true);
  }

  check_eq("stopall_all_open", wait_until([&] {
    for (const auto& s : bench.handed_out) if (!s->open.load()) return false;
    return true;
  }), true);

  reg.stop_all();
  check_eq("stopall_empty", reg.size(), std::size_t{0});

  int released = 0;
  for (const auto& s : bench.handed_out) released += s->releases.load();
  check_eq("stopall_released", released, 4);

  auto late = reg.register_board("/dev/ttyFAKE9");
  check_eq("stopall_refuses_new", late.st.ok, false);

  reg.stop_all();
  check_eq("stopall_twice", reg.size(), std::size_t{0});
}

static void test_empty_registry_is_settled() {
  Bench bench;
  SessionRegistry reg(fast_cfg(), bench.factory());
  check_eq("empty_settled", reg.all_settled(), true);
  check_eq("empty_no_event", reg.next_event(1ms).has_value(), false);
  check_eq("empty_no_snapshot", reg.snapshot(1).has_value(), false);
  check_eq("empty_no_elapsed", reg.elapsed_text(1, flashwatch::monitor::Clock::now()).has_value(), false);
}

int main() {
  test_ids_unique_and_not_reused();
  test_register_rejects_bad_input();
  test_stop_unknown_board();
  test_boards_are_independent();
  test_per_board_order();
  test_stop_all_releases_every_port();
  test_empty_registry_is_settled();

  std::fprintf(stdout, "session_registry: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
