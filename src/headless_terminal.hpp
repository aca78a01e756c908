#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: ITerminal without a tty, for automated tests and render
 * verification. Every byte the flush engine produces is recorded in a
 * StringSink; input arrives through feed_input() or post_event().
 * The mode strings are the xterm defaults AnsiTerminal falls back to.
 */
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include "iterminal.hpp"
#include "input.hpp"
#include "output_sink.hpp"

class HeadlessTerminal : public ITerminal {
public:
  static constexpr std::string_view kEnterSeq = "\x1b[?1049h\x1b[?25l";
  static constexpr std::string_view kExitSeq = "\x1b[?25h\x1b[?1049l\x1b[0m";

  HeadlessTerminal(int width, int height, ColorMode mode = ColorMode::TrueColor);
  ~HeadlessTerminal() override;
  HeadlessTerminal(const HeadlessTerminal&) = delete;
  HeadlessTerminal& operator=(const HeadlessTerminal&) = delete;

  bool init(std::string& msg) override;
  void fini() override;
  void emergency_reset() override;
  bool is_active() const override;
  TermSize get_size() const override;
  ColorMode color_mode() const override { return output_.color_mode(); }
  bool flush(std::span<const Cell> frame, int width, int height, std::string& msg) override;
  void clear(RGB bg) override;
  void set_cursor_visible(bool visible) override;
  void move_cursor(int x, int y) override;
  void sync() override;
  Event poll_event() override;
  void post_event(const Event& ev) override;
  FlushStats last_flush_stats() const override;

  // Changes the reported size and queues a Resize event, like SIGWINCH would.
  void set_size(int width, int height);
  // Decodes bytes as if typed; a trailing lone ESC is resolved immediately.
  void feed_input(std::string_view bytes);
  StringSink& sink() { return sink_; }
  int fini_count() const;

private:
  void push_locked(const Event& ev);

  StringSink sink_;
  OutputBuffer output_;
  TermSize size_;
  mutable std::mutex mu_;
  bool initialized_ = false;
  bool finalized_ = false;
  bool cursor_visible_ = true;
  int fini_count_ = 0;
  // Set by init; whoever clears it writes kExitSeq.
  std::atomic<bool> restore_pending_{false};

  std::mutex event_mu_;
  std::condition_variable event_cv_;
  std::deque<Event> events_;
  bool closed_ = false;
  InputDecoder decoder_;
};
