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
#include "monitor/session_registry.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace flashwatch::app {

// Console consumer of the board event stream. On a terminal it keeps one live
// row per board on the alternate screen; otherwise it logs each event, or
// prints it as a BOARDEVENT{...} JSON line for a GUI front end.
class MonitorView {
public:
  MonitorView(bool is_tty_enabled, bool output_in_json);
  ~MonitorView();

  MonitorView(const MonitorView &) = delete;
  MonitorView &operator=(const MonitorView &) = delete;

  void board_added(const flashwatch::monitor::Board &b);
  void event(const flashwatch::monitor::Event &ev);

  // Pulls states and elapsed times from the registry. Redraws at most ~30 times a second.
  void refresh(const flashwatch::monitor::SessionRegistry &reg);

  void notice(std::string msg);
  void fail(std::string msg);
  void done(std::string msg);

private:
  struct Row {
    flashwatch::monitor::Board board;
    flashwatch::monitor::State state = flashwatch::monitor::State::Idle;
    double percent = 0.0;
    std::string elapsed = "--:--:--.---";
    std::string last_line;
    std::string error;
    std::string passed_by;
  };

  struct TermSize {
    int rows = 0;
    int cols = 0;
  };
  enum class Align { None, Left, Right };

  void redraw_(bool force);
  void log_event_(const Row &r, const flashwatch::monitor::Event &ev) const;
  void json_event_(const Row &r, const flashwatch::monitor::Event &ev) const;
  std::string summary_() const;
  TermSize term_size_() const;

  static bool is_tty_();
  static bool colors_enabled_();
  static bool utf8_enabled_();

  // Display columns of s; one per code point in UTF-8 mode, one per byte otherwise.
  std::size_t cols_(std::string_view s) const;
  // Cuts s to width columns (ending in an ellipsis when cut). Unless align is
  // None, the result is then padded with spaces to exactly width columns.
  std::string fit_(std::string_view s, std::size_t width, Align align) const;
  std::string bar_(double percent, std::size_t width) const;

  bool tty_ = false, color_ = false, utf8_ = false;
  bool output_json_ = false;

  mutable std::mutex mtx_;

  std::map<flashwatch::monitor::BoardId, Row> rows_;
  std::string notice_line_, status_line_;
  bool fatal_ = false;

  std::chrono::steady_clock::time_point last_redraw_{};
};

} // namespace flashwatch::app
