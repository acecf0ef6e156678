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

#include "platform/linux/sysfs_tty.hpp"

#include "core/str.hpp"

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace flashwatch::sysfs {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kSysClassTty = "/sys/class/tty";

// USB serial adapters sit a few levels below the usb_device node that carries the ids.
constexpr int kMaxUsbWalk = 4;

std::string read_text_file(const fs::path &p) {
  std::ifstream in(p);
  if (!in.is_open())
    return {};
  std::string s;
  std::getline(in, s);
  return s;
}

std::optional<std::uint16_t> parse_u16_hex(std::string_view s) {
  s = flashwatch::core::trim(s);

  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 16);
  if (ec != std::errc{})
    return std::nullopt;
  if (ptr != s.data() + s.size())
    return std::nullopt;
  if (v > 0xFFFFu)
    return std::nullopt;
  return static_cast<std::uint16_t>(v);
}

std::string link_basename(const fs::path &link) {
  std::error_code ec;
  const auto target = fs::read_symlink(link, ec);
  if (ec)
    return {};
  return target.filename().string();
}

void load_usb_ids(const fs::path &device_dir, SerialPortInfo &out) {
  std::error_code ec;
  fs::path dir = fs::canonical(device_dir, ec);
  if (ec)
    return;

  for (int i = 0; i < kMaxUsbWalk && !dir.empty() && dir != dir.root_path(); ++i) {
    const auto vend = parse_u16_hex(read_text_file(dir / "idVendor"));
    const auto prod = parse_u16_hex(read_text_file(dir / "idProduct"));
    if (vend && prod) {
      out.vendor = *vend;
      out.product = *prod;
      return;
    }
    dir = dir.parent_path();
  }
}

std::optional<SerialPortInfo> load_one(const fs::path &dir, std::string name) {
  const fs::path device = dir / "device";

  std::error_code ec;
  if (!fs::exists(device, ec) || ec)
    return std::nullopt;

  SerialPortInfo out;
  out.name = std::move(name);
  out.subsystem = link_basename(device / "subsystem");
  out.driver = link_basename(device / "driver");

  // serial8250 registers a ttyS* for every legacy I/O port whether or not a UART is there.
  if (out.subsystem == "platform")
    return std::nullopt;

  if (!fs::exists(out.devnode(), ec) || ec)
    return std::nullopt;

  load_usb_ids(device, out);
  return out;
}

} // namespace

std::string SerialPortInfo::devnode() const { return "/dev/" + name; }

std::string SerialPortInfo::describe() const {
  if (is_usb()) {
    return fmt::format("{} (USB {:04x}:{:04x}, driver {})", devnode(), vendor, product,
                       driver.empty() ? "-" : driver);
  }
  return fmt::format("{} ({}, driver {})", devnode(), subsystem.empty() ? "-" : subsystem,
                     driver.empty() ? "-" : driver);
}

std::vector<SerialPortInfo> enumerate_serial_ports() { return enumerate_serial_ports(kSysClassTty); }

std::vector<SerialPortInfo> enumerate_serial_ports(std::string_view class_dir) {
  std::vector<SerialPortInfo> out;

  std::error_code ec;
  const fs::path base{class_dir};
  if (!fs::is_directory(base, ec) || ec)
    return out;

  // A walk error ends the listing; it is reported below.
  fs::directory_iterator it(base, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto name = it->path().filename().string();

    auto info = load_one(it->path(), name);
    if (!info) {
      spdlog::trace("Skipping tty without hardware: {}", name);
      continue;
    }

    spdlog::debug("Found serial port: {}", info->describe());
    out.push_back(std::move(*info));
  }
  if (ec)
    spdlog::warn("Listing {} stopped early: {}", class_dir, ec.message());

  std::sort(out.begin(), out.end(),
            [](const auto &a, const auto &b) { return a.name < b.name; });

  return out;
}

std::optional<SerialPortInfo> find_by_name(std::string_view name) {
  if (name.starts_with("/dev/"))
    name.remove_prefix(5);
  if (name.empty() || flashwatch::core::contains(name, "/"))
    return std::nullopt;

  const fs::path dir = fs::path{kSysClassTty} / std::string(name);
  std::error_code ec;
  if (!fs::is_directory(dir, ec) || ec)
    return std::nullopt;
  return load_one(dir, std::string(name));
}

} // namespace flashwatch::sysfs
