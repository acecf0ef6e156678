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

#include "platform/posix-common/tty_serial.hpp"

#include <cerrno>
#include <cstring>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/ioctl.h>

#include <spdlog/spdlog.h>

namespace flashwatch::posix_common {

using flashwatch::core::Errc;
using flashwatch::core::Status;

TtySerial::~TtySerial() { close(); }

std::optional<speed_t> TtySerial::baud_to_speed(int baud) noexcept {
  switch (baud) {
    case 1200: return B1200;
    case 2400: return B2400;
    case 4800: return B4800;
    case 9600: return B9600;
    case 19200: return B19200;
    case 38400: return B38400;
    case 57600: return B57600;
    case 115200: return B115200;
    case 230400: return B230400;
#ifdef B460800
    case 460800: return B460800;
#endif
#ifdef B921600
    case 921600: return B921600;
#endif
#ifdef B1000000
    case 1000000: return B1000000;
#endif
#ifdef B1500000
    case 1500000: return B1500000;
#endif
#ifdef B2000000
    case 2000000: return B2000000;
#endif
    default: return std::nullopt;
  }
}

// Raw 8N1, no flow control, reads return at once with whatever is there.
Status TtySerial::configure_line_(const FileHandle& fd, const std::string& port, speed_t speed, int baud) {
  struct termios tio{};
  if (do_tcgetattr(fd, &tio) != 0) {
    return Status::Failf(Errc::PortOpen, "{}: not a tty: {}", port, std::strerror(errno));
  }

  ::cfmakeraw(&tio);
  tio.c_cflag |= (CLOCAL | CREAD);
  tio.c_cflag &= ~static_cast<tcflag_t>(CSTOPB | CRTSCTS);
  tio.c_cc[VMIN] = 0;
  tio.c_cc[VTIME] = 0;

  if (::cfsetispeed(&tio, speed) != 0 || ::cfsetospeed(&tio, speed) != 0) {
    return Status::Failf(Errc::PortOpen, "{}: cannot set {} baud: {}", port, baud, std::strerror(errno));
  }
  if (do_tcsetattr(fd, TCSANOW, &tio) != 0) {
    return Status::Failf(Errc::PortOpen, "{}: cannot configure line: {}", port, std::strerror(errno));
  }
  return Status::Ok();
}

Status TtySerial::open(const std::string& port, int baud) {
  close();

  const auto speed = baud_to_speed(baud);
  if (!speed) return Status::Failf(Errc::PortOpen, "{}: unsupported baud rate {}", port, baud);

  FileHandle fd{do_open(port.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK | O_CLOEXEC)};
  if (!fd.valid()) return Status::Failf(Errc::PortOpen, "Cannot open {}: {}", port, std::strerror(errno));

  // A second TIOCEXCL holder is refused at open() with EBUSY, not here.
  if (do_ioctl(fd, TIOCEXCL, nullptr) < 0) {
    return Status::Failf(Errc::PortOpen, "{}: cannot claim exclusive access: {}", port, std::strerror(errno));
  }

  FW_TRY(configure_line_(fd, port, *speed, baud));

  // Stale bytes from before the board was reset are not part of this session.
  (void)do_tcflush(fd, TCIFLUSH);

  fd_ = std::move(fd);
  port_ = port;
  baud_ = baud;
  exclusive_ = true;

  spdlog::info("Opened {} at {} baud", port_, baud_);
  return Status::Ok();
}

Status TtySerial::check_hangup_() const noexcept {
  struct pollfd p{};
  p.fd = fd_.fd;
  p.events = POLLIN;

  const int rc = ::poll(&p, 1, 0);
  if (rc < 0) {
    if (errno == EINTR) return Status::Ok();
    return Status::Failf(Errc::PortIO, "{}: poll failed: {}", port_, std::strerror(errno));
  }
  if (rc > 0 && (p.revents & (POLLHUP | POLLERR | POLLNVAL))) {
    return Status::Failf(Errc::PortIO, "{}: device disconnected", port_);
  }
  return Status::Ok();
}

Status TtySerial::poll_available(std::vector<std::uint8_t>& out) {
  if (!fd_.valid()) return Status::Failf(Errc::PortIO, "{}: port is not open", port_);

  int avail = 0;
  if (do_ioctl(fd_, FIONREAD, &avail) < 0) {
    return Status::Failf(Errc::PortIO, "{}: FIONREAD failed: {}", port_, std::strerror(errno));
  }
  if (avail <= 0) return check_hangup_();

  const std::size_t old = out.size();
  out.resize(old + static_cast<std::size_t>(avail));

  const int n = do_read(fd_, out.data() + old, static_cast<std::size_t>(avail));
  if (n < 0) {
    const int e = errno;
    out.resize(old);
    if (e == EAGAIN || e == EWOULDBLOCK || e == EINTR) return Status::Ok();
    return Status::Failf(Errc::PortIO, "{}: read failed: {}", port_, std::strerror(e));
  }
  if (n == 0) {
    out.resize(old);
    return Status::Failf(Errc::PortIO, "{}: device disconnected", port_);
  }

  out.resize(old + static_cast<std::size_t>(n));
  return Status::Ok();
}

void TtySerial::close() noexcept {
  if (!fd_.valid()) return;

  if (exclusive_) {
    (void)::ioctl(fd_.fd, TIOCNXCL, nullptr);
    exclusive_ = false;
  }
  if (fd_.close()) spdlog::debug("Closed {}", port_);
}

} // namespace flashwatch::posix_common
