#pragma once
/*
 * Palette
 *
 * Purpose: xterm-256 palette and deterministic nearest-index mapping, used by
 * the flush engine when the terminal lacks truecolor.
 * Layout: 0..15 ANSI, 16..231 6x6x6 cube, 232..255 gray ramp.
 */
#include <cstdint>
#include "types.hpp"

RGB palette256_rgb(int idx);
// Nearest by squared distance over ANSI, cube and gray candidates; ties go to the lower index.
uint8_t rgb_to_palette256(RGB c);
