#include "color.hpp"
#include <algorithm>
#include <array>
#include <cmath>

static uint8_t clamp_channel(double v) {
  if (v >= 255.0) return 255;
  if (v <= 0.0) return 0;
  return static_cast<uint8_t>(v);
}

static uint8_t clamp_channel(int v) {
  return static_cast<uint8_t>(std::clamp(v, 0, 255));
}

RGB scale(RGB c, double factor) {
  return {clamp_channel(c.r * factor), clamp_channel(c.g * factor), clamp_channel(c.b * factor)};
}

RGB add(RGB a, RGB b) {
  return {clamp_channel(a.r + b.r), clamp_channel(a.g + b.g), clamp_channel(a.b + b.b)};
}

RGB lerp(RGB a, RGB b, double t) {
  auto ch = [t](uint8_t x, uint8_t y) { return clamp_channel(x + (static_cast<int>(y) - static_cast<int>(x)) * t); };
  return {ch(a.r, b.r), ch(a.g, b.g), ch(a.b, b.b)};
}

static uint8_t screen_channel(uint8_t d, uint8_t s) {
  return static_cast<uint8_t>(255 - (255 - d) * (255 - s) / 255);
}

RGB screen(RGB base, RGB blend) {
  return {screen_channel(base.r, blend.r), screen_channel(base.g, blend.g), screen_channel(base.b, blend.b)};
}

// Multiply below mid-gray, screen above; keeps the base's highlights and shadows.
static uint8_t overlay_channel(uint8_t d, uint8_t s) {
  if (d < 128) return static_cast<uint8_t>(2 * d * s / 255);
  return static_cast<uint8_t>(255 - 2 * (255 - d) * (255 - s) / 255);
}

RGB overlay(RGB base, RGB blend) {
  return {overlay_channel(base.r, blend.r), overlay_channel(base.g, blend.g), overlay_channel(base.b, blend.b)};
}

namespace {
struct SoftLightTable {
  std::array<double, 256> norm{};
  std::array<double, 256> g{};
  SoftLightTable() {
    for (int i = 0; i < 256; ++i) {
      double d = i / 255.0;
      norm[i] = d;
      g[i] = d <= 0.25 ? ((16.0 * d - 12.0) * d + 4.0) * d : std::sqrt(d);
    }
  }
};
const SoftLightTable& soft_light_table() {
  static const SoftLightTable t;
  return t;
}
}

static uint8_t soft_light_channel(uint8_t d, uint8_t s) {
  const auto& t = soft_light_table();
  double df = t.norm[d];
  double sf = t.norm[s];
  double r = sf < 0.5 ? df - (1.0 - 2.0 * sf) * df * (1.0 - df)
                      : df + (2.0 * sf - 1.0) * (t.g[d] - df);
  return clamp_channel(r * 255.0 + 0.5);
}

RGB soft_light(RGB base, RGB blend) {
  return {soft_light_channel(base.r, blend.r), soft_light_channel(base.g, blend.g), soft_light_channel(base.b, blend.b)};
}

RGB alpha_blend(RGB base, RGB src, double a) {
  if (a >= 1.0) return src;
  if (a <= 0.0) return base;
  double inv = 1.0 - a;
  return {clamp_channel(base.r * inv + src.r * a),
          clamp_channel(base.g * inv + src.g * a),
          clamp_channel(base.b * inv + src.b * a)};
}

RGB max(RGB a, RGB b) {
  return {std::max(a.r, b.r), std::max(a.g, b.g), std::max(a.b, b.b)};
}

RGB grayscale(RGB c) {
  uint8_t y = static_cast<uint8_t>((c.r * 299 + c.g * 587 + c.b * 114) / 1000);
  return {y, y, y};
}

RGB compose(BlendMode mode, RGB base, RGB src, double alpha) {
  switch (mode) {
    case BlendMode::Replace: return src;
    case BlendMode::Alpha: return alpha_blend(base, src, alpha);
    case BlendMode::Add: return alpha_blend(base, add(base, src), alpha);
    case BlendMode::Screen: return alpha_blend(base, screen(base, src), alpha);
    case BlendMode::Overlay: return alpha_blend(base, overlay(base, src), alpha);
    case BlendMode::SoftLight: return alpha_blend(base, soft_light(base, src), alpha);
    case BlendMode::Max: return alpha_blend(base, max(base, src), alpha);
  }
  return src;
}

const char* blend_mode_name(BlendMode mode) {
  switch (mode) {
    case BlendMode::Replace: return "replace";
    case BlendMode::Alpha: return "alpha";
    case BlendMode::Add: return "add";
    case BlendMode::Screen: return "screen";
    case BlendMode::Overlay: return "overlay";
    case BlendMode::SoftLight: return "softlight";
    case BlendMode::Max: return "max";
  }
  return "unknown";
}
