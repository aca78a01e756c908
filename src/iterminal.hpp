#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal surface (lifecycle, size, diffed flush, events).
 * Goal: decouple callers from the concrete backend (ANSI tty / headless),
 * enable testing against recorded bytes.
 * Lifecycle: construct -> init -> (size, flush)* -> fini. fini is idempotent
 * and safe to call from another thread while a flush is running.
 * emergency_reset is for std::terminate, where a lock may never be released.
 */
#include <span>
#include <string>
#include "types.hpp"
#include "event.hpp"
#include "output_buffer.hpp"

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual bool init(std::string& msg) = 0;
  virtual void fini() = 0;
  // Crash-path restore: takes no locks, so it works while a flush holds them.
  // Writes the restore sequence at most once across fini and itself.
  virtual void emergency_reset() = 0;
  virtual bool is_active() const = 0;
  virtual TermSize get_size() const = 0;
  virtual ColorMode color_mode() const = 0;
  // Returns false only on a write failure; size mismatches force a full redraw.
  virtual bool flush(std::span<const Cell> frame, int width, int height, std::string& msg) = 0;
  virtual void clear(RGB bg) = 0;
  virtual void set_cursor_visible(bool visible) = 0;
  virtual void move_cursor(int x, int y) = 0;
  virtual void sync() = 0;
  // Blocks until the next event; returns Closed once finalized.
  virtual Event poll_event() = 0;
  virtual void post_event(const Event& ev) = 0;
  virtual FlushStats last_flush_stats() const = 0;
};
