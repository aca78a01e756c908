#pragma once
/*
 * Color
 *
 * Purpose: per-channel RGB math and blend operators on the 0..255 domain.
 * Contract: pure and total; every result saturates to [0,255], nothing wraps.
 */
#include "types.hpp"

namespace colors {
inline constexpr RGB Black{0, 0, 0};
inline constexpr RGB Gray{120, 120, 120};
inline constexpr RGB LightGray{200, 200, 200};
inline constexpr RGB White{255, 255, 255};
inline constexpr RGB Red{255, 0, 0};
inline constexpr RGB Green{0, 255, 0};
inline constexpr RGB Blue{0, 0, 255};
inline constexpr RGB Orange{255, 165, 0};
}

RGB scale(RGB c, double factor);
RGB add(RGB a, RGB b);
// t is not clamped; extrapolated values saturate per channel.
RGB lerp(RGB a, RGB b, double t);
RGB screen(RGB base, RGB blend);
RGB overlay(RGB base, RGB blend);
// Perez soft light, rounded to nearest.
RGB soft_light(RGB base, RGB blend);
// Straight alpha: base*(1-a) + src*a, a clamped to [0,1].
RGB alpha_blend(RGB base, RGB src, double a);
RGB max(RGB a, RGB b);
// Rec. 601 integer luma.
RGB grayscale(RGB c);

/*
 * Single composer for every BlendMode. Replace ignores alpha, Alpha uses it as
 * the straight-alpha factor, the rest apply it as post-blend intensity.
 */
RGB compose(BlendMode mode, RGB base, RGB src, double alpha);

const char* blend_mode_name(BlendMode mode);
