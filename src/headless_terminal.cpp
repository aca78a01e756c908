#include "headless_terminal.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>
#include "color.hpp"

HeadlessTerminal::HeadlessTerminal(int width, int height, ColorMode mode)
  : output_(sink_, mode), size_{width, height} {}

HeadlessTerminal::~HeadlessTerminal() {
  fini();
}

bool HeadlessTerminal::init(std::string& msg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (finalized_) { msg = "terminal already finalized"; return false; }
  if (initialized_) return true;
  if (size_.width <= 0 || size_.height <= 0) {
    msg = "terminal unavailable: headless size must be positive";
    return false;
  }
  output_.resize(size_.width, size_.height);
  if (!output_.write_raw(kEnterSeq, msg) || !output_.clear_screen(colors::Black, msg)) {
    msg = "terminal unavailable: " + msg;
    return false;
  }
  cursor_visible_ = false;
  initialized_ = true;
  restore_pending_.store(true);
  spdlog::info("terminal: headless init {}x{}", size_.width, size_.height);
  return true;
}

void HeadlessTerminal::fini() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!initialized_ || finalized_) return;
    finalized_ = true;
    fini_count_++;
    std::string err;
    if (restore_pending_.exchange(false) && !output_.write_raw(kExitSeq, err)) {
      spdlog::warn("terminal: restore sequence not written: {}", err);
    }
    cursor_visible_ = true;
    spdlog::info("terminal: headless fini");
  }
  std::lock_guard<std::mutex> lock(event_mu_);
  closed_ = true;
  event_cv_.notify_all();
}

void HeadlessTerminal::emergency_reset() {
  if (!restore_pending_.exchange(false)) return;
  std::string err;
  if (!sink_.write(kExitSeq, err)) spdlog::warn("terminal: emergency restore not written: {}", err);
}

bool HeadlessTerminal::is_active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return initialized_ && !finalized_;
}

TermSize HeadlessTerminal::get_size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return size_;
}

int HeadlessTerminal::fini_count() const {
  std::lock_guard<std::mutex> lock(mu_);
  return fini_count_;
}

bool HeadlessTerminal::flush(std::span<const Cell> frame, int width, int height, std::string& msg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return true;
  return output_.flush(frame, width, height, msg);
}

void HeadlessTerminal::clear(RGB bg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  std::string err;
  if (!output_.clear_screen(bg, err)) spdlog::error("terminal: clear failed: {}", err);
}

void HeadlessTerminal::set_cursor_visible(bool visible) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_ || cursor_visible_ == visible) return;
  cursor_visible_ = visible;
  std::string err;
  if (!output_.write_raw(visible ? "\x1b[?25h" : "\x1b[?25l", err)) {
    spdlog::error("terminal: cursor visibility not written: {}", err);
  }
}

void HeadlessTerminal::move_cursor(int x, int y) {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  x = std::clamp(x, 0, std::max(0, size_.width - 1));
  y = std::clamp(y, 0, std::max(0, size_.height - 1));
  std::string err;
  if (!output_.move_cursor(x, y, err)) spdlog::error("terminal: move cursor failed: {}", err);
}

void HeadlessTerminal::sync() {
  std::lock_guard<std::mutex> lock(mu_);
  if (!initialized_ || finalized_) return;
  output_.resize(size_.width, size_.height);
}

FlushStats HeadlessTerminal::last_flush_stats() const {
  std::lock_guard<std::mutex> lock(mu_);
  return output_.last_stats();
}

void HeadlessTerminal::set_size(int width, int height) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    size_ = {width, height};
  }
  Event ev;
  ev.type = EventType::Resize;
  ev.width = width;
  ev.height = height;
  post_event(ev);
}

void HeadlessTerminal::push_locked(const Event& ev) {
  events_.push_back(ev);
  event_cv_.notify_one();
}

void HeadlessTerminal::post_event(const Event& ev) {
  std::lock_guard<std::mutex> lock(event_mu_);
  push_locked(ev);
}

void HeadlessTerminal::feed_input(std::string_view bytes) {
  std::vector<Event> out;
  std::lock_guard<std::mutex> lock(event_mu_);
  decoder_.feed(bytes, out);
  decoder_.flush_pending(out);
  for (const auto& ev : out) push_locked(ev);
}

Event HeadlessTerminal::poll_event() {
  std::unique_lock<std::mutex> lock(event_mu_);
  event_cv_.wait(lock, [this]{ return !events_.empty() || closed_; });
  if (!events_.empty()) {
    Event ev = events_.front();
    events_.pop_front();
    return ev;
  }
  Event ev;
  ev.type = EventType::Closed;
  return ev;
}
