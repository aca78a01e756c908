#include "palette.hpp"
#include <algorithm>
#include <array>

static constexpr int kCubeLevel[6] = {0, 95, 135, 175, 215, 255};

static constexpr std::array<RGB, 256> build_palette() {
  std::array<RGB, 256> p{};
  constexpr uint8_t ansi[16][3] = {
    {0, 0, 0}, {205, 0, 0}, {0, 205, 0}, {205, 205, 0},
    {0, 0, 238}, {205, 0, 205}, {0, 205, 205}, {229, 229, 229},
    {127, 127, 127}, {255, 0, 0}, {0, 255, 0}, {255, 255, 0},
    {92, 92, 255}, {255, 0, 255}, {0, 255, 255}, {255, 255, 255},
  };
  for (int i = 0; i < 16; ++i) p[i] = RGB{ansi[i][0], ansi[i][1], ansi[i][2]};
  for (int i = 16; i <= 231; ++i) {
    int idx = i - 16;
    p[i] = RGB{static_cast<uint8_t>(kCubeLevel[idx / 36]),
               static_cast<uint8_t>(kCubeLevel[(idx % 36) / 6]),
               static_cast<uint8_t>(kCubeLevel[idx % 6])};
  }
  for (int i = 232; i <= 255; ++i) {
    uint8_t shade = static_cast<uint8_t>(8 + (i - 232) * 10);
    p[i] = RGB{shade, shade, shade};
  }
  return p;
}

static constexpr std::array<RGB, 256> kPalette = build_palette();

static int dist2(RGB a, RGB b) {
  int dr = a.r - b.r, dg = a.g - b.g, db = a.b - b.b;
  return dr * dr + dg * dg + db * db;
}

static int nearest_level(uint8_t v) {
  if (v < 48) return 0;
  if (v < 115) return 1;
  if (v < 155) return 2;
  if (v < 195) return 3;
  if (v < 235) return 4;
  return 5;
}

RGB palette256_rgb(int idx) {
  return kPalette[static_cast<size_t>(std::clamp(idx, 0, 255))];
}

uint8_t rgb_to_palette256(RGB c) {
  int best_idx = 0;
  int best_d2 = dist2(c, kPalette[0]);
  for (int i = 1; i < 16; ++i) {
    int d2 = dist2(c, kPalette[i]);
    if (d2 < best_d2) { best_d2 = d2; best_idx = i; }
  }

  int cube_idx = 16 + 36 * nearest_level(c.r) + 6 * nearest_level(c.g) + nearest_level(c.b);
  int cube_d2 = dist2(c, kPalette[cube_idx]);
  if (cube_d2 < best_d2) { best_d2 = cube_d2; best_idx = cube_idx; }

  int avg = (c.r + c.g + c.b + 1) / 3;
  int gray_idx = 232;
  if (avg >= 238) gray_idx = 255;
  else if (avg > 8) gray_idx = 232 + std::clamp((avg - 8 + 5) / 10, 0, 23);
  int gray_d2 = dist2(c, kPalette[gray_idx]);
  if (gray_d2 < best_d2) best_idx = gray_idx;

  return static_cast<uint8_t>(best_idx);
}
