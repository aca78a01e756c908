#pragma once
/*
 * RenderBuffer
 *
 * Purpose: compositing grid; draws blend into existing cells instead of
 * overwriting them, then resolve() exports a Frame for ITerminal::flush.
 * Clipping: out-of-bounds writes are silent no-ops.
 * Glyph rule: kNoGlyph keeps the cell's glyph and attrs (color-only pass);
 * any other glyph replaces glyph, fg and attrs. bg is always composited.
 */
#include <span>
#include <string_view>
#include "types.hpp"
#include "color.hpp"

class RenderBuffer {
public:
  static constexpr Cell kBlankCell{U' ', colors::LightGray, colors::Black, AttrNone};

  RenderBuffer() = default;
  RenderBuffer(int width, int height);

  void resize(int width, int height);
  void clear();
  void clear(RGB bg);

  void set(int x, int y, char32_t rune, RGB fg, RGB bg, BlendMode mode, double alpha, Attr attrs);
  void set_solid(int x, int y, char32_t rune, RGB fg, RGB bg, Attr attrs = AttrNone);
  int set_string(int x, int y, std::string_view utf8, RGB fg, RGB bg, Attr attrs = AttrNone);
  void set_rune(int x, int y, char32_t rune);
  Cell get(int x, int y) const;

  Frame resolve() const;
  void resolve_into(Frame& out) const;
  std::span<const Cell> cells() const { return cells_; }

  int width() const { return width_; }
  int height() const { return height_; }
  bool in_bounds(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }

private:
  Frame cells_;
  int width_ = 0;
  int height_ = 0;
};
