#include "output_buffer.hpp"
#include <algorithm>
#include <charconv>
#include <spdlog/spdlog.h>
#include "palette.hpp"
#include "render_buffer.hpp"
#include "utf8.hpp"

static constexpr std::string_view kCsi = "\x1b[";
static constexpr std::string_view kSgr0 = "\x1b[0m";
static constexpr std::string_view kEraseDisplay = "\x1b[2J";
// Hangul Jamo onward; below this nothing renders double-width.
static constexpr char32_t kFirstWideCandidate = 0x1100;

OutputBuffer::OutputBuffer(IOutputSink& sink, ColorMode mode, size_t capacity)
  : sink_(sink), color_mode_(mode) {
  out_.reserve(capacity);
}

void OutputBuffer::resize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  front_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), Cell{});
  force_full_redraw();
}

void OutputBuffer::force_full_redraw() {
  front_valid_ = false;
  style_valid_ = false;
  cursor_valid_ = false;
}

void OutputBuffer::set_color_mode(ColorMode mode) {
  if (mode == color_mode_) return;
  color_mode_ = mode;
  force_full_redraw();
}

void OutputBuffer::write_int(int v) {
  char buf[12];
  auto res = std::to_chars(buf, buf + sizeof(buf), v);
  out_.append(buf, res.ptr);
}

void OutputBuffer::write_cursor_to(int x, int y) {
  // CUF is non-destructive, unlike overwriting the gap with spaces.
  if (cursor_valid_ && y == cursor_y_ && x > cursor_x_) {
    out_ += kCsi;
    write_int(x - cursor_x_);
    out_ += 'C';
  } else {
    out_ += kCsi;
    write_int(y + 1);
    out_ += ';';
    write_int(x + 1);
    out_ += 'H';
  }
  cursor_x_ = x;
  cursor_y_ = y;
  cursor_valid_ = true;
}

void OutputBuffer::write_fg_params(RGB fg, Attr attr) {
  if (attr & AttrFg256) {
    out_ += "38;5;";
    write_int(fg.r);
  } else if (color_mode_ == ColorMode::TrueColor) {
    out_ += "38;2;";
    write_int(fg.r); out_ += ';';
    write_int(fg.g); out_ += ';';
    write_int(fg.b);
  } else {
    out_ += "38;5;";
    write_int(rgb_to_palette256(fg));
  }
}

void OutputBuffer::write_bg_params(RGB bg, Attr attr) {
  if (attr & AttrBg256) {
    out_ += "48;5;";
    write_int(bg.r);
  } else if (color_mode_ == ColorMode::TrueColor) {
    out_ += "48;2;";
    write_int(bg.r); out_ += ';';
    write_int(bg.g); out_ += ';';
    write_int(bg.b);
  } else {
    out_ += "48;5;";
    write_int(rgb_to_palette256(bg));
  }
}

void OutputBuffer::write_style(const Cell& c) {
  bool fg_changed = !style_valid_ || c.fg != last_fg_ || (c.attrs & AttrFg256) != (last_attr_ & AttrFg256);
  bool bg_changed = !style_valid_ || c.bg != last_bg_ || (c.attrs & AttrBg256) != (last_attr_ & AttrBg256);
  Attr style = c.attrs & AttrStyle;
  bool attr_changed = !style_valid_ || style != (last_attr_ & AttrStyle);
  if (!fg_changed && !bg_changed && !attr_changed) return;

  out_ += kCsi;
  if (attr_changed) {
    // Style bits can only be cleared by a reset, so colors follow in full.
    out_ += '0';
    if (style & AttrBold) out_ += ";1";
    if (style & AttrDim) out_ += ";2";
    if (style & AttrItalic) out_ += ";3";
    if (style & AttrUnderline) out_ += ";4";
    if (style & AttrBlink) out_ += ";5";
    if (style & AttrReverse) out_ += ";7";
    out_ += ';';
    write_fg_params(c.fg, c.attrs);
    out_ += ';';
    write_bg_params(c.bg, c.attrs);
  } else if (fg_changed && bg_changed) {
    write_fg_params(c.fg, c.attrs);
    out_ += ';';
    write_bg_params(c.bg, c.attrs);
  } else if (fg_changed) {
    write_fg_params(c.fg, c.attrs);
  } else {
    write_bg_params(c.bg, c.attrs);
  }
  out_ += 'm';

  last_fg_ = c.fg;
  last_bg_ = c.bg;
  last_attr_ = c.attrs;
  style_valid_ = true;
}

bool OutputBuffer::commit(std::string& msg) {
  if (out_.empty()) return true;
  if (!sink_.write(out_, msg)) {
    spdlog::error("flush: {} ({} bytes dropped)", msg, out_.size());
    out_.clear();
    force_full_redraw();
    return false;
  }
  out_.clear();
  return true;
}

bool OutputBuffer::flush(std::span<const Cell> frame, int width, int height, std::string& msg) {
  stats_ = FlushStats{};
  // Checked before resize so a bogus size never sizes the cache.
  size_t expected = static_cast<size_t>(std::max(0, width)) * static_cast<size_t>(std::max(0, height));
  if (frame.size() < expected) {
    spdlog::warn("flush: frame has {} cells, {}x{} needs {}; dropped", frame.size(), width, height, expected);
    force_full_redraw();
    return true;
  }
  if (width != width_ || height != height_) {
    spdlog::debug("flush: size {}x{} -> {}x{}, full redraw", width_, height_, width, height);
    resize(width, height);
  }

  stats_.cells = expected;
  stats_.full_redraw = !front_valid_;
  out_.clear();

  for (int y = 0; y < height_; ++y) {
    size_t row = static_cast<size_t>(y) * width_;
    int x = 0;
    while (x < width_) {
      if (front_valid_ && frame[row + x] == front_[row + x]) { x++; continue; }
      write_cursor_to(x, y);
      stats_.runs++;
      while (x < width_) {
        const Cell& c = frame[row + x];
        if (front_valid_ && c == front_[row + x]) break;
        write_style(c);
        char32_t r = c.rune == kNoGlyph ? U' ' : c.rune;
        if (r < 0x80) out_.push_back(static_cast<char>(r));
        else utf8_append(out_, r);
        if (r >= kFirstWideCandidate) cursor_valid_ = false;
        cursor_x_++;
        stats_.cells_written++;
        x++;
      }
    }
  }

  if (!out_.empty()) {
    out_ += kSgr0;
    style_valid_ = false;
  }
  stats_.bytes = out_.size();
  if (!commit(msg)) return false;

  std::copy(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(expected), front_.begin());
  front_valid_ = true;
  return true;
}

bool OutputBuffer::clear_screen(RGB bg, std::string& msg) {
  out_.clear();
  out_ += kSgr0;
  out_ += kCsi;
  write_bg_params(bg, AttrNone);
  out_ += 'm';
  out_ += kEraseDisplay;
  out_ += kSgr0;
  style_valid_ = false;
  cursor_valid_ = false;
  if (!commit(msg)) return false;
  Cell blank = RenderBuffer::kBlankCell;
  blank.bg = bg;
  std::fill(front_.begin(), front_.end(), blank);
  front_valid_ = true;
  return true;
}

bool OutputBuffer::move_cursor(int x, int y, std::string& msg) {
  out_.clear();
  cursor_valid_ = false;
  write_cursor_to(x, y);
  return commit(msg);
}

bool OutputBuffer::write_raw(std::string_view bytes, std::string& msg) {
  out_.assign(bytes);
  return commit(msg);
}
