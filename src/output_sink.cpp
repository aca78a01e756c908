#include "output_sink.hpp"
#include <cerrno>
#include <cstring>
#include <new>
#include <poll.h>
#include <unistd.h>

bool FdSink::write(std::string_view data, std::string& msg) {
  size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::write(fd_, data.data() + off, data.size() - off);
    if (n > 0) { off += static_cast<size_t>(n); continue; }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
      pollfd p{fd_, POLLOUT, 0};
      if (::poll(&p, 1, 1000) > 0) continue;
      msg = "terminal write timed out";
      return false;
    }
    msg = std::string("terminal write failed: ") + (n < 0 ? std::strerror(errno) : "short write");
    return false;
  }
  return true;
}

bool StringSink::write(std::string_view data, std::string& msg) {
  if (throw_next_) {
    throw_next_ = false;
    throw std::bad_alloc();
  }
  if (fail_) { msg = "terminal write failed: Broken pipe"; return false; }
  data_.append(data);
  writes_++;
  return true;
}
