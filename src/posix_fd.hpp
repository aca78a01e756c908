#pragma once
/*
 * UniqueFd / SelfPipe
 *
 * Purpose: RAII ownership of POSIX descriptors. SelfPipe is a non-blocking
 * wake-up channel: notify() is async-signal-safe, drain() empties it.
 */
#include <cerrno>
#include <cstring>
#include <string>
#include <fcntl.h>
#include <unistd.h>

class UniqueFd {
public:
  UniqueFd() : fd_(-1) {}
  explicit UniqueFd(int fd) : fd_(fd) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  UniqueFd(UniqueFd&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UniqueFd& operator=(UniqueFd&& other) noexcept {
    if (this != &other) { close_if_needed(); fd_ = other.fd_; other.fd_ = -1; }
    return *this;
  }
  ~UniqueFd() { close_if_needed(); }
  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }
  void reset(int fd = -1) { close_if_needed(); fd_ = fd; }
private:
  void close_if_needed() { if (fd_ >= 0) { ::close(fd_); fd_ = -1; } }
  int fd_;
};

class SelfPipe {
public:
  bool open(std::string& msg) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC | O_NONBLOCK) != 0) {
      msg = std::string("pipe2 failed: ") + std::strerror(errno);
      return false;
    }
    read_end_.reset(fds[0]);
    write_end_.reset(fds[1]);
    return true;
  }
  bool valid() const { return read_end_.valid() && write_end_.valid(); }
  int read_fd() const { return read_end_.get(); }
  int write_fd() const { return write_end_.get(); }
  void notify() const {
    if (!write_end_.valid()) return;
    char b = 1;
    // A full pipe already guarantees a pending wake-up.
    while (::write(write_end_.get(), &b, 1) < 0 && errno == EINTR) {}
  }
  void drain() const {
    char buf[64];
    while (::read(read_end_.get(), buf, sizeof(buf)) > 0) {}
  }
private:
  UniqueFd read_end_;
  UniqueFd write_end_;
};
