#include "render_buffer.hpp"
#include <algorithm>
#include "utf8.hpp"

RenderBuffer::RenderBuffer(int width, int height) {
  resize(width, height);
}

void RenderBuffer::resize(int width, int height) {
  width_ = std::max(0, width);
  height_ = std::max(0, height);
  cells_.assign(static_cast<size_t>(width_) * static_cast<size_t>(height_), kBlankCell);
}

void RenderBuffer::clear() {
  std::fill(cells_.begin(), cells_.end(), kBlankCell);
}

void RenderBuffer::clear(RGB bg) {
  Cell blank = kBlankCell;
  blank.bg = bg;
  std::fill(cells_.begin(), cells_.end(), blank);
}

void RenderBuffer::set(int x, int y, char32_t rune, RGB fg, RGB bg, BlendMode mode, double alpha, Attr attrs) {
  if (!in_bounds(x, y)) return;
  Cell& dst = cells_[static_cast<size_t>(y) * width_ + x];
  dst.bg = compose(mode, dst.bg, bg, alpha);
  if (rune != kNoGlyph) {
    dst.rune = rune;
    dst.fg = fg;
    dst.attrs = attrs;
    return;
  }
  // Color-only pass: light-emitting modes brighten the existing glyph too.
  switch (mode) {
    case BlendMode::Add:
    case BlendMode::Screen:
    case BlendMode::Max:
      dst.fg = compose(mode, dst.fg, fg, alpha);
      break;
    default:
      break;
  }
}

void RenderBuffer::set_solid(int x, int y, char32_t rune, RGB fg, RGB bg, Attr attrs) {
  set(x, y, rune, fg, bg, BlendMode::Replace, 1.0, attrs);
}

int RenderBuffer::set_string(int x, int y, std::string_view utf8, RGB fg, RGB bg, Attr attrs) {
  if (y < 0 || y >= height_) return 0;
  int written = 0;
  size_t i = 0;
  while (i < utf8.size() && x < width_) {
    char32_t cp = kReplacementChar;
    size_t n = utf8_decode(utf8.substr(i), cp);
    if (n == 0) { cp = kReplacementChar; n = utf8.size() - i; }
    i += n;
    if (x >= 0 && cp != kNoGlyph) {
      set_solid(x, y, cp, fg, bg, attrs);
      written++;
    }
    x++;
  }
  return written;
}

void RenderBuffer::set_rune(int x, int y, char32_t rune) {
  if (!in_bounds(x, y)) return;
  cells_[static_cast<size_t>(y) * width_ + x].rune = rune;
}

Cell RenderBuffer::get(int x, int y) const {
  if (!in_bounds(x, y)) return kBlankCell;
  return cells_[static_cast<size_t>(y) * width_ + x];
}

Frame RenderBuffer::resolve() const {
  return cells_;
}

void RenderBuffer::resolve_into(Frame& out) const {
  out.assign(cells_.begin(), cells_.end());
}
