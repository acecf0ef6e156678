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

#include "core/status.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace flashwatch::core {

class ISerialChannel {
 public:
  virtual ~ISerialChannel() = default;

  // Errc::PortOpen on failure.
  virtual Status open(const std::string& port, int baud) = 0;

  // Appends whatever is ready without blocking; nothing appended is not an error.
  // Errc::PortIO on failure.
  virtual Status poll_available(std::vector<std::uint8_t>& out) = 0;

  // Idempotent.
  virtual void close() noexcept = 0;

  virtual bool is_open() const noexcept = 0;
  virtual const std::string& port() const noexcept = 0;
};

} // namespace flashwatch::core
