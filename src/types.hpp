#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (RGB/Cell/Attr/BlendMode/ColorMode).
 * Principle: carry simple value state; no behavior beyond equality.
 */
#include <cstdint>
#include <vector>

struct RGB {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;
  bool operator==(const RGB&) const = default;
};

// Attr is a bitmask; Fg256/Bg256 mean the color's r channel holds a palette index.
using Attr = uint8_t;
inline constexpr Attr AttrNone      = 0;
inline constexpr Attr AttrBold      = 1 << 0;
inline constexpr Attr AttrDim       = 1 << 1;
inline constexpr Attr AttrItalic    = 1 << 2;
inline constexpr Attr AttrUnderline = 1 << 3;
inline constexpr Attr AttrBlink     = 1 << 4;
inline constexpr Attr AttrReverse   = 1 << 5;
inline constexpr Attr AttrFg256     = 1 << 6;
inline constexpr Attr AttrBg256     = 1 << 7;
inline constexpr Attr AttrStyle = AttrBold | AttrDim | AttrItalic | AttrUnderline | AttrBlink | AttrReverse;

// Glyph sentinel: "no glyph drawn". Never a printable code point.
inline constexpr char32_t kNoGlyph = 0;

struct Cell {
  char32_t rune = kNoGlyph;
  RGB fg{};
  RGB bg{};
  Attr attrs = AttrNone;
  bool operator==(const Cell&) const = default;
};

// Row-major, index y*width+x.
using Frame = std::vector<Cell>;

enum class BlendMode { Replace, Alpha, Add, Screen, Overlay, SoftLight, Max };

enum class ColorMode { Palette256, TrueColor };

struct TermSize { int width = 0; int height = 0; };
