#pragma once
/*
 * OutputBuffer
 *
 * Purpose: diff flush engine. Keeps the last flushed frame (front), compares
 * an incoming Frame cell by cell and encodes only changed runs as ANSI.
 * Wire: one cursor move per dirty run, SGR only on style change, ESC[0m at
 * the end of every non-empty flush. Bytes go to the sink in a single write.
 * Cells are one column wide; after a glyph that may be wider the next run is
 * placed with an absolute CUP instead of a relative CUF.
 * Ownership: borrows the sink; the front cache is private to this object.
 */
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include "types.hpp"
#include "output_sink.hpp"
#include "config.hpp"

struct FlushStats {
  size_t cells = 0;
  size_t cells_written = 0;
  size_t runs = 0;
  size_t bytes = 0;
  bool full_redraw = false;
};

class OutputBuffer {
public:
  OutputBuffer(IOutputSink& sink, ColorMode mode, size_t capacity = LUMEN_OUTPUT_BUFFER_SIZE);

  void resize(int width, int height);
  bool flush(std::span<const Cell> frame, int width, int height, std::string& msg);
  void force_full_redraw();

  bool clear_screen(RGB bg, std::string& msg);
  bool move_cursor(int x, int y, std::string& msg);
  // Out-of-band bytes (cursor visibility etc.) in stream order.
  bool write_raw(std::string_view bytes, std::string& msg);

  ColorMode color_mode() const { return color_mode_; }
  void set_color_mode(ColorMode mode);
  const FlushStats& last_stats() const { return stats_; }
  int width() const { return width_; }
  int height() const { return height_; }

private:
  void write_cursor_to(int x, int y);
  void write_style(const Cell& c);
  void write_fg_params(RGB fg, Attr attr);
  void write_bg_params(RGB bg, Attr attr);
  void write_int(int v);
  bool commit(std::string& msg);

  IOutputSink& sink_;
  ColorMode color_mode_;
  std::string out_;
  std::vector<Cell> front_;
  bool front_valid_ = false;
  int width_ = 0;
  int height_ = 0;

  int cursor_x_ = 0;
  int cursor_y_ = 0;
  bool cursor_valid_ = false;

  RGB last_fg_{};
  RGB last_bg_{};
  Attr last_attr_ = AttrNone;
  bool style_valid_ = false;

  FlushStats stats_;
};
