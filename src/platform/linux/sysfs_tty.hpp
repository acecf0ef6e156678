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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace flashwatch::sysfs {

struct SerialPortInfo {
  std::string name;
  std::string subsystem;
  std::string driver;
  std::uint16_t vendor = 0;
  std::uint16_t product = 0;

  std::string devnode() const;
  std::string describe() const;
  bool is_usb() const noexcept { return vendor != 0 || product != 0; }
};

// Serial ports backed by real hardware, sorted by name. Legacy platform
// UARTs without a device behind them (most ttyS*) are skipped.
std::vector<SerialPortInfo> enumerate_serial_ports();
// Same walk over another class directory laid out like /sys/class/tty.
std::vector<SerialPortInfo> enumerate_serial_ports(std::string_view class_dir);
std::optional<SerialPortInfo> find_by_name(std::string_view name);

} // namespace flashwatch::sysfs
