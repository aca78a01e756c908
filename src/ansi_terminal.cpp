#include "ansi_terminal.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <poll.h>
#include <sys/ioctl.h>
#include <unistd.h>
#include <spdlog/spdlog.h>
#include "color.hpp"

static constexpr std::string_view kSgr0 = "\x1b[0m";

static std::atomic<int> g_winch_fd{-1};
static std::atomic<bool> g_resize_pending{false};

extern "C" void lumen_on_winch(int) {
  int saved_errno = errno;
  g_resize_pending.store(true);
  int fd = g_winch_fd.load();
  if (fd >= 0) {
    char b = 1;
    ssize_t r = ::write(fd, &b, 1);
    (void)r;
  }
  errno = saved_errno;
}

static const char* color_mode_name(ColorMode m) {
  return m == ColorMode::TrueColor ? "truecolor" : "256";
}

AnsiTerminal::AnsiTerminal(const Config& cfg)
  : AnsiTerminal(STDIN_FILENO, STDOUT_FILENO, cfg) {}

AnsiTerminal::AnsiTerminal(int in_fd, int out_fd, const Config& cfg)
  : in_fd_(in_fd), out_fd_(out_fd), cfg_(cfg), sink_(out_fd) {}

AnsiTerminal::~AnsiTerminal() {
  fini();
}

TermSize AnsiTerminal::query_size() const {
  winsize ws{};
  if (::ioctl(out_fd_, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
    return {ws.ws_col, ws.ws_row};
  }
  return {0, 0};
}

ColorMode AnsiTerminal::detect_color_mode() const {
  if (cfg_.color == LUMEN_COLOR_TRUECOLOR) return ColorMode::TrueColor;
  if (cfg_.color == LUMEN_COLOR_256) return ColorMode::Palette256;
  if (const char* ct = std::getenv("COLORTERM")) {
    std::string v(ct);
    if (v.find("truecolor") != std::string::npos || v.find("24bit") != std::string::npos) return ColorMode::TrueColor;
  }
  if (caps_.truecolor) return ColorMode::TrueColor;
  return ColorMode::Palette256;
}

bool AnsiTerminal::init(std::string& msg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (initialized_ && !finalized_) return true;
  if (finalized_) { msg = "terminal already finalized"; return false; }
  if (!::isatty(in_fd_) || !::isatty(out_fd_)) {
    msg = "terminal unavailable: stdin/stdout is not a tty";
    return false;
  }
  if (!probe_terminfo(out_fd_, caps_, msg)) {
    msg = "terminal unavailable: " + msg;
    return false;
  }
  color_mode_ = detect_color_mode();
  size_ = query_size();
  if (size_.width <= 0 || size_.height <= 0) size_ = {80, 24};

  if (::tcgetattr(in_fd_, &saved_termios_) != 0) {
    msg = std::string("terminal unavailable: tcgetattr: ") + std::strerror(errno);
    return false;
  }
  termios raw = saved_termios_;
  ::cfmakeraw(&raw);
  raw.c_cc[VMIN] = 1;
  raw.c_cc[VTIME] = 0;
  if (::tcsetattr(in_fd_, TCSAFLUSH, &raw) != 0) {
    msg = std::string("terminal unavailable: tcsetattr: ") + std::strerror(errno);
    return false;
  }
  have_saved_termios_ = true;

  if (!wake_.valid() && !wake_.open(msg)) {
    restore_modes();
    return false;
  }
  g_winch_fd.store(wake_.write_fd());
  struct sigaction sa{};
  sa.sa_handler = lumen_on_winch;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = SA_RESTART;
  have_saved_winch_ = ::sigaction(SIGWINCH, &sa, &saved_winch_) == 0;

  output_ = std::make_unique<OutputBuffer>(sink_, color_mode_);
  output_->resize(size_.width, size_.height);
  std::string werr;
  if (!output_->write_raw(caps_.enter_alt_screen + caps_.hide_cursor, werr) ||
      !output_->clear_screen(colors::Black, werr)) {
    restore_modes();
    output_.reset();
    msg = "terminal unavailable: " + werr;
    return false;
  }
  cursor_visible_.store(false);
  restore_seq_ = caps_.show_cursor + caps_.exit_alt_screen + std::string(kSgr0);
  initialized_ = true;
  restore_pending_.store(true);
  spdlog::info("terminal: init TERM={} {}x{} colors={} mode={}",
               caps_.name, size_.width, size_.height, caps_.colors, color_mode_name(color_mode_));
  return true;
}

void AnsiTerminal::restore_modes() {
  if (have_saved_winch_) {
    if (::sigaction(SIGWINCH, &saved_winch_, nullptr) != 0) spdlog::warn("terminal: restoring SIGWINCH handler failed");
    have_saved_winch_ = false;
  }
  g_winch_fd.store(-1);
  if (have_saved_termios_) {
    if (::tcsetattr(in_fd_, TCSAFLUSH, &saved_termios_) != 0) {
      spdlog::warn("terminal: restoring termios failed: {}", std::strerror(errno));
    }
    have_saved_termios_ = false;
  }
}

void AnsiTerminal::fini() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!initialized_ || finalized_) return;
    finalized_ = true;
    std::string err;
    if (restore_pending_.exchange(false) && !output_->write_raw(restore_seq_, err)) {
      spdlog::warn("terminal: restore sequence not written: {}", err);
    }
    cursor_visible_.store(true);
    restore_modes();
    spdlog::info("terminal: fini");
  }
  closed_.store(true);
  wake_.notify();
}

void AnsiTerminal::emergency_reset() {
  if (!restore_pending_.exchange(false)) return;
  // Straight to the fd: the OutputBuffer may be mid-frame under mu_.
  std::string err;
  if (!sink_.write(restore_seq_, err)) spdlog::warn("terminal: emergency restore not written: {}", err);
  // saved_termios_ is written once by init, before restore_pending_ is set.
  if (::tcsetattr(in_fd_, TCSANOW, &saved_termios_) != 0) {
    spdlog::warn("terminal: emergency termios restore failed: {}", std::strerror(errno));
  }
  closed_.store(true);
  wake_.notify();
}

bool AnsiTerminal::is_active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return initialized_ && !finalized_;
}

TermSize AnsiTerminal::get_size() const {
  TermSize sz = query_size();
  if (sz.width > 0 && sz.height > 0) return sz;
  std::lock_guard<std::mutex> lock(mu_);
  return size_;
}

ColorMode AnsiTerminal::color_mode() const {
  std::lock_guard<std::mutex> lock(mu_);
  return color_mode_;
}

bool AnsiTerminal::flush(std::span<const Cell> frame, int width, int height, std::string& msg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return true;
  size_ = {width, height};
  return output_->flush(frame, width, height, msg);
}

void AnsiTerminal::clear(RGB bg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  std::string err;
  if (!output_->clear_screen(bg, err)) spdlog::error("terminal: clear failed: {}", err);
}

void AnsiTerminal::set_cursor_visible(bool visible) {
  if (cursor_visible_.exchange(visible) == visible) return;
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  std::string err;
  if (!output_->write_raw(visible ? caps_.show_cursor : caps_.hide_cursor, err)) {
    spdlog::error("terminal: cursor visibility not written: {}", err);
  }
}

void AnsiTerminal::move_cursor(int x, int y) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  x = std::clamp(x, 0, std::max(0, size_.width - 1));
  y = std::clamp(y, 0, std::max(0, size_.height - 1));
  std::string err;
  if (!output_->move_cursor(x, y, err)) spdlog::error("terminal: move cursor failed: {}", err);
}

void AnsiTerminal::sync() {
  TermSize sz = query_size();
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  if (sz.width > 0 && sz.height > 0) size_ = sz;
  output_->resize(size_.width, size_.height);
  spdlog::debug("terminal: sync {}x{}", size_.width, size_.height);
}

FlushStats AnsiTerminal::last_flush_stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return output_ ? output_->last_stats() : FlushStats{};
}

void AnsiTerminal::post_event(const Event& ev) {
  {
    std::lock_guard<std::mutex> lock(event_mu_);
    synthetic_.push_back(ev);
  }
  wake_.notify();
}

Event AnsiTerminal::poll_event() {
  std::vector<Event> fresh;
  for (;;) {
    {
      std::lock_guard<std::mutex> lock(event_mu_);
      if (!synthetic_.empty()) {
        Event ev = synthetic_.front();
        synthetic_.pop_front();
        return ev;
      }
    }
    if (!decoded_.empty()) {
      Event ev = decoded_.front();
      decoded_.pop_front();
      return ev;
    }
    Event closed;
    closed.type = EventType::Closed;
    if (closed_.load() || !wake_.valid()) return closed;

    if (g_resize_pending.exchange(false)) {
      TermSize sz = query_size();
      if (sz.width > 0 && sz.height > 0) {
        {
          std::lock_guard<std::mutex> lock(mu_);
          size_ = sz;
        }
        Event ev;
        ev.type = EventType::Resize;
        ev.width = sz.width;
        ev.height = sz.height;
        spdlog::debug("terminal: resize {}x{}", sz.width, sz.height);
        return ev;
      }
    }

    pollfd fds[2] = {{in_fd_, POLLIN, 0}, {wake_.read_fd(), POLLIN, 0}};
    int timeout = decoder_.has_pending() ? cfg_.escape_timeout_ms : -1;
    int n = ::poll(fds, 2, timeout);
    if (n < 0) {
      if (errno == EINTR) continue;
      Event ev;
      ev.type = EventType::Error;
      ev.error = std::string("poll failed: ") + std::strerror(errno);
      return ev;
    }
    fresh.clear();
    if (n == 0) {
      decoder_.flush_pending(fresh);
      decoded_.insert(decoded_.end(), fresh.begin(), fresh.end());
      continue;
    }
    if (fds[1].revents & POLLIN) wake_.drain();
    if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
      char buf[256];
      ssize_t r = ::read(in_fd_, buf, sizeof(buf));
      if (r > 0) {
        decoder_.feed(std::string_view(buf, static_cast<size_t>(r)), fresh);
        decoded_.insert(decoded_.end(), fresh.begin(), fresh.end());
      } else if (r == 0) {
        closed_.store(true);
      } else if (errno != EINTR && errno != EAGAIN) {
        Event ev;
        ev.type = EventType::Error;
        ev.error = std::string("input read failed: ") + std::strerror(errno);
        return ev;
      }
    }
  }
}
