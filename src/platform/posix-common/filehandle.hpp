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

#include <cerrno>
#include <cstring>

#include <spdlog/spdlog.h>

#include <fcntl.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace flashwatch {

struct FileHandle {
  int fd = -1;

  FileHandle() = default;
  explicit FileHandle(int fd_) : fd(fd_) {}

  FileHandle(const FileHandle&) = delete;
  FileHandle& operator=(const FileHandle&) = delete;

  FileHandle(FileHandle&& o) noexcept : fd(o.fd) { o.fd = -1; }
  FileHandle& operator=(FileHandle&& o) noexcept {
    if (this == &o) return *this;
    close();
    fd = o.fd;
    o.fd = -1;
    return *this;
  }

  ~FileHandle() { close(); }

  // Returns true only for the call that actually released the descriptor.
  bool close() noexcept {
    if (fd < 0) return false;
    ::close(fd);
    fd = -1;
    return true;
  }

  bool valid() const noexcept { return fd >= 0; }

  static int open(const char* path, int flags, const char* flags_desc) noexcept {
    const int rc = ::open(path, flags);
    if (rc < 0) {
      const int e = errno;
      spdlog::debug("open(path={}, flags={}): {}", path, flags_desc, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int ioctl(unsigned long request, void* arg, const char* req_name) const noexcept {
    const int rc = ::ioctl(fd, request, arg);
    if (rc < 0) {
      const int e = errno;
      spdlog::error("ioctl(fd={}, req={}): {}", fd, req_name, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int read(void* buf, size_t count) const noexcept {
    const ssize_t rc = ::read(fd, buf, count);
    if (rc < 0 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
      const int e = errno;
      spdlog::error("read(fd={}, count={}): {}", fd, count, std::strerror(e));
      errno = e;
    }
    return static_cast<int>(rc);
  }

  int tcgetattr(struct termios* tio) const noexcept {
    const int rc = ::tcgetattr(fd, tio);
    if (rc != 0) {
      const int e = errno;
      spdlog::error("tcgetattr(fd={}): {}", fd, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int tcsetattr(int actions, const struct termios* tio, const char* actions_desc) const noexcept {
    const int rc = ::tcsetattr(fd, actions, tio);
    if (rc != 0) {
      const int e = errno;
      spdlog::error("tcsetattr(fd={}, actions={}): {}", fd, actions_desc, std::strerror(e));
      errno = e;
    }
    return rc;
  }

  int tcflush(int queue, const char* queue_desc) const noexcept {
    const int rc = ::tcflush(fd, queue);
    if (rc != 0) {
      const int e = errno;
      spdlog::warn("tcflush(fd={}, queue={}): {}", fd, queue_desc, std::strerror(e));
      errno = e;
    }
    return rc;
  }
};

} // namespace flashwatch

#define do_open(path, flags) (FileHandle::open(path, flags, #flags))
#define do_ioctl(fd, request, arg) ((fd).valid() ? (fd).ioctl(request, arg, #request) : -1)
#define do_read(fd, buf, count) ((fd).valid() ? (fd).read(buf, count) : -1)
#define do_tcgetattr(fd, tio) ((fd).valid() ? (fd).tcgetattr(tio) : -1)
#define do_tcsetattr(fd, actions, tio) ((fd).valid() ? (fd).tcsetattr(actions, tio, #actions) : -1)
#define do_tcflush(fd, queue) ((fd).valid() ? (fd).tcflush(queue, #queue) : -1)
