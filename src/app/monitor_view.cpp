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

#include "app/monitor_view.hpp"
#include "app/version.hpp"

#include "core/str.hpp"
#include "core/utf8.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

#include <sys/ioctl.h>
#include <unistd.h>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace flashwatch::app {

using flashwatch::monitor::BoardId;
using flashwatch::monitor::Event;
using flashwatch::monitor::EventKind;
using flashwatch::monitor::State;

namespace {

std::size_t u8_advance(std::string_view s, std::size_t i) {
  if (i >= s.size()) return s.size();
  const std::size_t n = flashwatch::core::u8_valid_len(s, i);
  return std::min(i + (n ? n : 1), s.size());
}

std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (unsigned char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\b': out += "\\b"; break;
      case '\f': out += "\\f"; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default:
        if (c < 0x20) out += fmt::format("\\u{:04x}", c);
        else out.push_back(static_cast<char>(c));
        break;
    }
  }
  return out;
}

bool env_has_utf8() {
  auto has = [](const char *v) {
    if (!v || !*v) return false;
    std::string s(v);
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s.find("utf-8") != std::string::npos || s.find("utf8") != std::string::npos;
  };
  return has(std::getenv("LC_ALL")) || has(std::getenv("LC_CTYPE")) || has(std::getenv("LANG"));
}

std::string board_label(const flashwatch::monitor::Board &b) {
  return fmt::format("Board {} ({})", b.id, b.port.empty() ? "-" : b.port);
}

constexpr const char *kAltOn = "\x1b[?1049h";
constexpr const char *kAltOff = "\x1b[?1049l";
constexpr const char *kHideCursor = "\x1b[?25l";
constexpr const char *kShowCursor = "\x1b[?25h";

constexpr const char *kReset = "\x1b[0m";
constexpr const char *kBold = "\x1b[1m";

constexpr const char *kRed = "\x1b[31m";
constexpr const char *kGreen = "\x1b[32m";
constexpr const char *kYellow = "\x1b[33m";
constexpr const char *kBlue = "\x1b[34m";
constexpr const char *kCyan = "\x1b[36m";
constexpr const char *kGray = "\x1b[90m";

const char *state_color(State s) {
  switch (s) {
    case State::Flashed:
    case State::TimedOut: return kGreen;
    case State::Errored: return kRed;
    case State::Active: return kYellow;
    default: return kGray;
  }
}

// ~30 Hz; enough for a running millisecond clock to look live.
constexpr auto kRedrawEvery = std::chrono::milliseconds(33);

} // namespace

bool MonitorView::is_tty_() { return ::isatty(1) == 1; }

bool MonitorView::colors_enabled_() {
  if (!is_tty_()) return false;
  const char *no = std::getenv("NO_COLOR");
  return !(no && *no);
}

bool MonitorView::utf8_enabled_() { return is_tty_() && env_has_utf8(); }

MonitorView::MonitorView(bool is_tty_enabled, bool output_in_json)
    : output_json_(output_in_json) {
  if (is_tty_enabled && !output_in_json) {
    tty_ = is_tty_();
    color_ = colors_enabled_();
    utf8_ = utf8_enabled_();
  }
  last_redraw_ = std::chrono::steady_clock::now();

  if (tty_) std::cout << kAltOn << kHideCursor << std::flush;
}

MonitorView::~MonitorView() {
  std::string final, summary;
  bool fatal = false;
  {
    std::lock_guard lk(mtx_);
    final = status_line_;
    fatal = fatal_;
    if (tty_) summary = summary_();
  }

  if (tty_) std::cout << kShowCursor << kAltOff << std::flush;

  if (!summary.empty()) std::cout << summary << std::flush;
  if (tty_ && !final.empty())
    (fatal ? std::cerr : std::cout) << final << "\n" << std::flush;
}

void MonitorView::board_added(const flashwatch::monitor::Board &b) {
  std::lock_guard lk(mtx_);
  auto &r = rows_[b.id];
  r.board = b;

  if (output_json_) {
    fmt::print(R"(BOARDEVENT{{"board":{},"port":"{}","event":"added","text":"","percent":0}})" "\n",
               b.id, json_escape(b.port));
    std::fflush(stdout);
  } else if (!tty_) {
    spdlog::info("{}: watching at {} baud", board_label(b), b.baud);
  }
  redraw_(true);
}

void MonitorView::event(const Event &ev) {
  std::lock_guard lk(mtx_);
  auto &r = rows_[ev.board];
  if (!r.board.id) r.board.id = ev.board;

  switch (ev.kind) {
    case EventKind::LineReceived:
      r.last_line = ev.text;
      break;
    case EventKind::DecodeError:
      break;
    case EventKind::PortError:
      r.error = ev.text;
      r.state = State::Errored;
      break;
    case EventKind::FirstTransmission:
      if (r.state == State::Idle || r.state == State::Listening) r.state = State::Active;
      break;
    case EventKind::Flashed:
      r.passed_by = ev.text;
      r.percent = 100.0;
      r.state = (ev.text == flashwatch::monitor::kFlashedByMarker) ? State::Flashed : State::TimedOut;
      break;
    case EventKind::Progress:
      r.percent = std::max(r.percent, ev.percent);
      break;
  }

  if (output_json_) json_event_(r, ev);
  else if (!tty_) log_event_(r, ev);

  redraw_(ev.kind != EventKind::LineReceived && ev.kind != EventKind::Progress);
}

void MonitorView::refresh(const flashwatch::monitor::SessionRegistry &reg) {
  std::vector<BoardId> ids;
  {
    std::lock_guard lk(mtx_);
    ids.reserve(rows_.size());
    for (const auto &[id, r] : rows_) ids.push_back(id);
  }

  const auto now = flashwatch::monitor::Clock::now();
  std::vector<std::pair<flashwatch::monitor::SessionSnapshot, std::string>> live;
  live.reserve(ids.size());
  for (const auto id : ids) {
    auto snap = reg.snapshot(id);
    auto el = reg.elapsed_text(id, now);
    if (snap && el) live.emplace_back(std::move(*snap), std::move(*el));
  }

  std::lock_guard lk(mtx_);
  for (auto &[snap, el] : live) {
    auto it = rows_.find(snap.board.id);
    if (it == rows_.end()) continue;
    auto &r = it->second;
    r.state = snap.state;
    r.percent = std::max(r.percent, snap.percent);
    r.elapsed = std::move(el);
  }
  redraw_(false);
}

void MonitorView::notice(std::string msg) {
  std::lock_guard lk(mtx_);
  if (!tty_ && !output_json_) spdlog::warn("{}", msg);
  notice_line_ = std::move(msg);
  redraw_(true);
}

void MonitorView::fail(std::string msg) {
  std::lock_guard lk(mtx_);
  if (!tty_ && !output_json_) spdlog::error("{}", msg);
  if (output_json_) {
    fmt::print(R"(MONITORSTATUS{{"fatal":true,"status":"{}"}})" "\n", json_escape(msg));
    std::fflush(stdout);
  }
  fatal_ = true;
  status_line_ = std::move(msg);
  redraw_(true);
}

void MonitorView::done(std::string msg) {
  std::lock_guard lk(mtx_);
  if (!tty_ && !output_json_) spdlog::info("{}", msg);
  if (output_json_) {
    fmt::print(R"(MONITORSTATUS{{"fatal":false,"status":"{}"}})" "\n", json_escape(msg));
    std::fflush(stdout);
  }
  fatal_ = false;
  status_line_ = std::move(msg);
  redraw_(true);
}

void MonitorView::log_event_(const Row &r, const Event &ev) const {
  const auto label = board_label(r.board);
  switch (ev.kind) {
    case EventKind::LineReceived:
      spdlog::info("{}: {}", label, ev.text);
      break;
    case EventKind::DecodeError:
      spdlog::warn("{}: {}", label, ev.text);
      break;
    case EventKind::PortError:
      spdlog::error("Board {} error: {}", r.board.id, ev.text);
      break;
    case EventKind::FirstTransmission:
      spdlog::info("{}: first transmission, flash timer started", label);
      break;
    case EventKind::Flashed:
      if (ev.text == flashwatch::monitor::kFlashedByMarker)
        spdlog::info("Board {} passed: firmware flashing completed on {}", r.board.id, r.board.port);
      else
        spdlog::info("Board {} passed: estimated flash time elapsed on {}, marker not seen", r.board.id, r.board.port);
      break;
    case EventKind::Progress:
      spdlog::info("{}: {:.0f}% (estimated)", label, ev.percent);
      break;
  }
}

void MonitorView::json_event_(const Row &r, const Event &ev) const {
  fmt::print(R"(BOARDEVENT{{"board":{},"port":"{}","event":"{}","text":"{}","percent":{:.2f}}})" "\n",
             ev.board, json_escape(r.board.port), flashwatch::monitor::event_name(ev.kind),
             json_escape(ev.text), ev.kind == EventKind::Progress ? ev.percent : r.percent);
  std::fflush(stdout);
}

std::string MonitorView::summary_() const {
  std::ostringstream out;
  for (const auto &[id, r] : rows_) {
    out << board_label(r.board) << ": ";
    if (!r.passed_by.empty()) out << "passed (" << r.passed_by << ") after " << r.elapsed;
    else if (!r.error.empty()) out << "error: " << r.error;
    else out << flashwatch::monitor::state_name(r.state) << fmt::format(" at {:.0f}%", r.percent);
    out << "\n";
  }
  return out.str();
}

MonitorView::TermSize MonitorView::term_size_() const {
  winsize ws{};
  if (::ioctl(1, TIOCGWINSZ, &ws) == 0)
    return {static_cast<int>(ws.ws_row), static_cast<int>(ws.ws_col)};
  return {24, 80};
}

std::size_t MonitorView::cols_(std::string_view s) const {
  if (!utf8_) return s.size();
  std::size_t n = 0;
  for (std::size_t i = 0; i < s.size(); i = u8_advance(s, i)) ++n;
  return n;
}

std::string MonitorView::fit_(std::string_view s, std::size_t width, Align align) const {
  std::string out;
  std::size_t used = cols_(s);

  if (used <= width) {
    out.assign(s);
  } else if (width > 0) {
    const std::string_view dots = utf8_ ? "…" : "...";
    const std::size_t dots_cols = utf8_ ? 1 : 3;

    if (width <= dots_cols) {
      out.assign(dots.substr(0, utf8_ ? dots.size() : width));
      used = width;
    } else {
      // keep width - dots_cols columns, then mark the cut
      std::size_t end = 0;
      for (std::size_t c = 0; c < width - dots_cols; ++c) end = utf8_ ? u8_advance(s, end) : end + 1;
      out.assign(s.substr(0, end));
      out.append(dots);
      used = width;
    }
  } else {
    used = 0;
  }

  if (align == Align::None || used >= width) return out;
  const std::string gap(width - used, ' ');
  return align == Align::Right ? gap + out : out + gap;
}

std::string MonitorView::bar_(double percent, std::size_t width) const {
  const double filled = std::clamp(percent, 0.0, 100.0) / 100.0 * static_cast<double>(width);

  std::string s;
  if (!utf8_) {
    const auto full = static_cast<std::size_t>(std::llround(filled));
    s.assign(full, '#');
    s.append(width - full, '.');
    return s;
  }

  // Whole cells, then one partial cell in eighths.
  static constexpr const char *kEighths[] = {"", "▏", "▎", "▍", "▌", "▋", "▊", "▉"};
  const auto eighths = static_cast<std::size_t>(std::floor(filled * 8.0));
  const std::size_t full = eighths / 8, part = eighths % 8;

  s.reserve(width * 3);
  for (std::size_t i = 0; i < full; ++i) s += "█";
  std::size_t drawn = full;
  if (part && drawn < width) {
    s += kEighths[part];
    ++drawn;
  }
  s.append(width - drawn, ' ');
  return s;
}

void MonitorView::redraw_(bool force) {
  if (!tty_) return;

  const auto now = std::chrono::steady_clock::now();
  if (!force && (now - last_redraw_) < kRedrawEvery) return;
  last_redraw_ = now;

  const auto ts = term_size_();
  const int rows = std::max(10, ts.rows), cols = std::max(60, ts.cols);
  const std::size_t C = static_cast<std::size_t>(cols);

  std::ostringstream out;
  out << "\x1b[H\x1b[J";

  auto emit = [&](const char *c, std::string_view plain) {
    if (color_) out << c;
    out << fit_(plain, C, Align::None);
    if (color_) out << kReset;
    out << "\n";
  };

  {
    if (color_) out << kBold;
    emit(kGray, "flashwatch v" + flashwatch::app::version_string() + " --- serial flash monitor");
    if (color_) out << kReset;
  }

  std::size_t active = 0, passed = 0, failed = 0;
  for (const auto &[id, r] : rows_) {
    if (r.state == State::Active) ++active;
    if (!r.passed_by.empty()) ++passed;
    if (!r.error.empty()) ++failed;
  }
  emit(kBlue, fmt::format("Boards: {}  Active: {}  Passed: {}  Errors: {}", rows_.size(), active, passed, failed));

  if (!notice_line_.empty()) emit(kGray, notice_line_);
  if (!status_line_.empty()) emit(fatal_ ? kRed : kGreen, status_line_);

  const int header = 2 + (!notice_line_.empty() ? 1 : 0) + (!status_line_.empty() ? 1 : 0) + 1;
  const int remaining = rows - header;

  if (rows_.empty()) { emit(kGray, "No boards yet..."); std::cout << out.str() << std::flush; return; }

  struct Cols { std::size_t id = 4, port = 14, st = 8, bar = 10, pct = 5, el = 12; } cw;
  if (C >= 120) { cw.port = 20; cw.bar = 24; }
  else if (C >= 96) { cw.port = 16; cw.bar = 16; }

  const std::size_t fixed = cw.id + 1 + cw.port + 1 + cw.st + 1 + cw.bar + 1 + cw.pct + 1 + cw.el + 2;
  const std::size_t last_w = C > fixed + 8 ? C - fixed : 8;

  auto row = [&](std::string_view id, std::string_view port, std::string_view st, std::string_view bar,
                 std::string_view pct, std::string_view el, std::string_view last) {
    std::ostringstream l;
    l << fit_(id, cw.id, Align::Right) << " " << fit_(port, cw.port, Align::Left) << " "
      << fit_(st, cw.st, Align::Left) << " " << fit_(bar, cw.bar, Align::Left) << " "
      << fit_(pct, cw.pct, Align::Right) << " " << fit_(el, cw.el, Align::Left) << "  "
      << fit_(last, last_w, Align::Left);
    return l.str();
  };

  emit(kCyan, row("ID", "PORT", "STATE", "PROGRESS", "PCT", "ELAPSED", "LAST LINE"));

  const std::size_t max_lines = static_cast<std::size_t>(std::max(1, remaining - 1));
  std::size_t shown = 0;

  for (const auto &[id, r] : rows_) {
    if (shown == max_lines) break;
    ++shown;

    // Board output may carry its own escape sequences; they must not reach the screen.
    std::string tail = flashwatch::core::printable(r.last_line);
    if (!r.error.empty()) tail = "error: " + flashwatch::core::printable(r.error);
    else if (r.passed_by == flashwatch::monitor::kFlashedByMarker) tail = "passed";
    else if (!r.passed_by.empty()) tail = "passed (estimated, marker not seen)";

    emit(state_color(r.state),
         row(fmt::to_string(id), r.board.port, flashwatch::monitor::state_name(r.state),
             bar_(r.percent, cw.bar), fmt::format("{:.0f}%", r.percent), r.elapsed, tail));
  }

  if (rows_.size() > shown) emit(kGray, fmt::format("↓ {} hidden", rows_.size() - shown));
  std::cout << out.str() << std::flush;
}

} // namespace flashwatch::app
