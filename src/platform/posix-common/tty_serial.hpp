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

#include "core/serial_channel.hpp"
#include "platform/posix-common/filehandle.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <termios.h>

namespace flashwatch::posix_common {

// Raw 8N1 tty, opened non-blocking and claimed with TIOCEXCL so no other
// process can attach to the same board while we hold it.
class TtySerial final : public flashwatch::core::ISerialChannel {
 public:
  TtySerial() = default;
  ~TtySerial() override;

  TtySerial(const TtySerial&) = delete;
  TtySerial& operator=(const TtySerial&) = delete;

  flashwatch::core::Status open(const std::string& port, int baud) override;
  flashwatch::core::Status poll_available(std::vector<std::uint8_t>& out) override;
  void close() noexcept override;

  bool is_open() const noexcept override { return fd_.valid(); }
  const std::string& port() const noexcept override { return port_; }

  static std::optional<speed_t> baud_to_speed(int baud) noexcept;

 private:
  static flashwatch::core::Status configure_line_(const flashwatch::FileHandle& fd, const std::string& port,
                                                  speed_t speed, int baud);
  flashwatch::core::Status check_hangup_() const noexcept;

  std::string port_;
  int baud_ = 0;
  flashwatch::FileHandle fd_;
  bool exclusive_ = false;
};

} // namespace flashwatch::posix_common
