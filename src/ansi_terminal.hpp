#pragma once
/*
 * AnsiTerminal
 *
 * Purpose: ITerminal for a real tty. Raw mode via termios, mode strings and
 * color capability from terminfo, diffed output through OutputBuffer.
 * Threads: one render thread calls flush/size; one input thread calls
 * poll_event; fini may come from either (or a signal watcher).
 * Note: SIGWINCH is process-wide, so only one instance may be active.
 */
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <signal.h>
#include <termios.h>
#include "iterminal.hpp"
#include "config.hpp"
#include "input.hpp"
#include "output_sink.hpp"
#include "posix_fd.hpp"
#include "terminfo.hpp"

class AnsiTerminal : public ITerminal {
public:
  explicit AnsiTerminal(const Config& cfg = Config{});
  AnsiTerminal(int in_fd, int out_fd, const Config& cfg);
  ~AnsiTerminal() override;
  AnsiTerminal(const AnsiTerminal&) = delete;
  AnsiTerminal& operator=(const AnsiTerminal&) = delete;

  bool init(std::string& msg) override;
  void fini() override;
  void emergency_reset() override;
  bool is_active() const override;
  TermSize get_size() const override;
  ColorMode color_mode() const override;
  bool flush(std::span<const Cell> frame, int width, int height, std::string& msg) override;
  void clear(RGB bg) override;
  void set_cursor_visible(bool visible) override;
  void move_cursor(int x, int y) override;
  void sync() override;
  Event poll_event() override;
  void post_event(const Event& ev) override;
  FlushStats last_flush_stats() const override;

  const TermCaps& caps() const { return caps_; }

private:
  TermSize query_size() const;
  ColorMode detect_color_mode() const;
  void restore_modes();

  int in_fd_;
  int out_fd_;
  Config cfg_;
  TermCaps caps_;
  FdSink sink_;
  std::unique_ptr<OutputBuffer> output_;
  ColorMode color_mode_ = ColorMode::Palette256;
  TermSize size_{};

  mutable std::mutex mu_;
  bool initialized_ = false;
  bool finalized_ = false;
  std::atomic<bool> closed_{false};
  std::atomic<bool> cursor_visible_{true};
  // Built by init, read-only afterwards.
  std::string restore_seq_;
  // Set by init; whoever clears it (fini or emergency_reset) writes restore_seq_.
  std::atomic<bool> restore_pending_{false};
  termios saved_termios_{};
  bool have_saved_termios_ = false;
  struct sigaction saved_winch_{};
  bool have_saved_winch_ = false;

  SelfPipe wake_;
  std::mutex event_mu_;
  std::deque<Event> synthetic_;
  // Touched only by the thread calling poll_event.
  InputDecoder decoder_;
  std::deque<Event> decoded_;
};
