#pragma once
/*
 * OutputSink
 *
 * Purpose: byte sink behind the flush engine. FdSink writes to a terminal fd,
 * StringSink records bytes for headless rendering and tests.
 * Contract: write() delivers all bytes or returns false with msg.
 */
#include <string>
#include <string_view>

class IOutputSink {
public:
  virtual ~IOutputSink() = default;
  virtual bool write(std::string_view data, std::string& msg) = 0;
};

class FdSink : public IOutputSink {
public:
  explicit FdSink(int fd) : fd_(fd) {}
  bool write(std::string_view data, std::string& msg) override;
  int fd() const { return fd_; }
private:
  int fd_;
};

class StringSink : public IOutputSink {
public:
  bool write(std::string_view data, std::string& msg) override;
  const std::string& data() const { return data_; }
  size_t write_count() const { return writes_; }
  void reset() { data_.clear(); writes_ = 0; }
  // Simulates a broken pipe on subsequent writes.
  void set_fail(bool fail) { fail_ = fail; }
  // The next write throws std::bad_alloc, as an exhausted allocator would.
  void set_throw_next(bool t) { throw_next_ = t; }
private:
  std::string data_;
  size_t writes_ = 0;
  bool fail_ = false;
  bool throw_next_ = false;
};
