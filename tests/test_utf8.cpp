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

#include "core/str.hpp"
#include "core/utf8.hpp"

#include <cstdio>
#include <string>
#include <string_view>

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

using flashwatch::core::u8_sanitize;
using flashwatch::core::u8_valid_len;

// ----- sequence lengths -----

static void test_valid_lengths() {
  check_eq("ascii", u8_valid_len("a", 0), std::size_t{1});
  check_eq("two_byte", u8_valid_len("\xC3\xA9", 0), std::size_t{2});
  check_eq("three_byte", u8_valid_len("\xE2\x82\xAC", 0), std::size_t{3});
  check_eq("four_byte", u8_valid_len("\xF0\x9F\x98\x80", 0), std::size_t{4});
}

static void test_rejected_sequences() {
  check_eq("overlong_c0", u8_valid_len("\xC0\xAF", 0), std::size_t{0});
  check_eq("overlong_e0", u8_valid_len("\xE0\x80\xAF", 0), std::size_t{0});
  check_eq("surrogate", u8_valid_len("\xED\xA0\x80", 0), std::size_t{0});
  check_eq("above_max", u8_valid_len("\xF4\x90\x80\x80", 0), std::size_t{0});
  check_eq("lone_continuation", u8_valid_len("\x80", 0), std::size_t{0});
  check_eq("truncated", u8_valid_len("\xE2\x82", 0), std::size_t{0});
  check_eq("bad_second", u8_valid_len("\xC3" "A", 0), std::size_t{0});
}

static void test_u8_cut_point() {
  using flashwatch::core::u8_cut_point;
  check_eq("cut_ascii", u8_cut_point("abcd"), std::size_t{4});
  check_eq("cut_complete", u8_cut_point("ab\xC3\xA9"), std::size_t{4});
  check_eq("cut_open_two", u8_cut_point("abc\xC3"), std::size_t{3});
  check_eq("cut_open_three", u8_cut_point("ab\xE2\x82"), std::size_t{2});
  check_eq("cut_open_four", u8_cut_point("a\xF0\x9F\x98"), std::size_t{1});
  check_eq("cut_garbage", u8_cut_point("ab\x80\x80"), std::size_t{4});
  check_eq("cut_whole_seq", u8_cut_point("\xE2\x82"), std::size_t{2});
}

// ----- lossy decode -----

static void test_sanitize_clean() {
  std::string out;
  const auto dropped = u8_sanitize("temp 21\xC2\xB0" "C", out);
  check_eq("clean_dropped", dropped, std::size_t{0});
  check_eq("clean_text", out, std::string("temp 21\xC2\xB0" "C"));
}

static void test_sanitize_counts_runs() {
  std::string out;
  const auto dropped = u8_sanitize("a\xFF\xFE" "b\xC0" "c", out);
  check_eq("runs_dropped", dropped, std::size_t{2});
  check_eq("runs_text", out, std::string("abc"));
}

static void test_sanitize_truncated_tail() {
  std::string out;
  const auto dropped = u8_sanitize("ok\xE2\x82", out);
  check_eq("tail_dropped", dropped, std::size_t{1});
  check_eq("tail_text", out, std::string("ok"));
}

static void test_sanitize_all_garbage() {
  std::string out;
  const auto dropped = u8_sanitize("\xFF\xFF\xFF", out);
  check_eq("garbage_dropped", dropped, std::size_t{1});
  check_eq("garbage_empty", out.empty(), true);
}

// ----- string helpers -----

static void test_trim() {
  using flashwatch::core::trim;
  check_eq("trim_crlf", trim("  boot ok\r"), std::string_view("boot ok"));
  check_eq("trim_blank", trim(" \t\r"), std::string_view());
  check_eq("trim_inner", trim("a  b"), std::string_view("a  b"));
}

static void test_contains() {
  using flashwatch::core::contains;
  check_eq("contains_hit", contains("xx needle yy", "needle"), true);
  check_eq("contains_case", contains("NEEDLE", "needle"), false);
}

static void test_printable() {
  using flashwatch::core::printable;
  check_eq("printable_plain", printable("Starting kernel ..."), std::string("Starting kernel ..."));
  check_eq("printable_sgr", printable("\x1B[1;32mOK\x1B[0m done"), std::string("OK done"));
  check_eq("printable_clear", printable("\x1B[2J\x1B[Hboot"), std::string("boot"));
  check_eq("printable_osc_bel", printable("\x1B]0;title\aafter"), std::string("after"));
  check_eq("printable_osc_st", printable("\x1B]2;t\x1B\\x"), std::string("x"));
  check_eq("printable_two_byte", printable("a\x1B" "7b\x1B" "8c"), std::string("abc"));
  check_eq("printable_c0", printable(std::string_view("a\bb\x07" "c\x7F\x00" "d", 8)), std::string("abcd"));
  check_eq("printable_tab", printable("x\ty"), std::string("x y"));
  check_eq("printable_utf8", printable("90\xC2\xB0" "C"), std::string("90\xC2\xB0" "C"));
  check_eq("printable_dangling_esc", printable("end\x1B"), std::string("end"));
  check_eq("printable_open_csi", printable("end\x1B[12"), std::string("end"));
}

int main() {
  test_valid_lengths();
  test_rejected_sequences();
  test_sanitize_clean();
  test_sanitize_counts_runs();
  test_sanitize_truncated_tail();
  test_sanitize_all_garbage();
  test_trim();
  test_contains();
  test_printable();
  test_u8_cut_point();

  std::fprintf(stdout, "utf8: %d passed, %d failed\n", g_pass, g_fail);
  return g_fail ? 1 : 0;
}
