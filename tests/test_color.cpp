#include "color.hpp"
#include <cassert>
#include <cstdlib>
#include <cstring>

static RGB gray(int v) {
  uint8_t c = static_cast<uint8_t>(v);
  return {c, c, c};
}

static void test_screen() {
  int prev = -1;
  for (int v = 0; v < 256; ++v) {
    RGB r = screen(gray(v), gray(v));
    int expect = 255 - (255 - v) * (255 - v) / 255;
    assert(r.r == expect && r.g == expect && r.b == expect);
    assert(r.r >= prev);
    prev = r.r;
  }
  assert(screen(gray(0), gray(0)) == gray(0));
  assert(screen(gray(255), gray(10)) == gray(255));
}

static void test_add() {
  for (int a = 0; a < 256; a += 15) {
    for (int b = 0; b < 256; b += 17) {
      RGB r = add(gray(a), gray(b));
      assert(r.r <= 255);
      assert(r.r >= (a > b ? a : b));
      assert(r.r == (a + b > 255 ? 255 : a + b));
    }
  }
  assert((add(RGB{200, 10, 0}, RGB{100, 10, 0}) == RGB{255, 20, 0}));
}

static void test_lerp_scale() {
  RGB a{12, 200, 77}, b{250, 3, 128};
  assert(lerp(a, b, 0.0) == a);
  assert(lerp(a, b, 1.0) == b);
  assert((lerp(gray(0), gray(255), 0.5) == gray(127)));
  assert((lerp(gray(100), gray(200), 2.0) == gray(255)));
  assert((scale(gray(100), 0.5) == gray(50)));
  assert((scale(gray(200), 2.0) == gray(255)));
  assert((scale(gray(200), -1.0) == gray(0)));
}

static void test_overlay_soft_light() {
  assert((overlay(gray(100), gray(200)) == gray(156)));
  assert((overlay(gray(200), gray(100)) == gray(189)));
  assert((overlay(gray(0), gray(255)) == gray(0)));
  // A 50% gray blend leaves the base almost untouched.
  for (int v = 0; v < 256; ++v) assert(soft_light(gray(v), gray(128)) == gray(v));
  for (int s : {64, 96, 160, 192}) {
    for (int d = 64; d < 192; ++d) {
      int sl = soft_light(gray(d), gray(s)).r;
      int ov = overlay(gray(d), gray(s)).r;
      assert(std::abs(sl - d) <= std::abs(ov - d));
    }
  }
}

static void test_alpha_compose() {
  RGB base{10, 20, 30}, src{210, 120, 230};
  assert(alpha_blend(base, src, 0.0) == base);
  assert(alpha_blend(base, src, 1.0) == src);
  assert(alpha_blend(base, src, -3.0) == base);
  assert(alpha_blend(base, src, 7.0) == src);
  assert((alpha_blend(gray(0), gray(200), 0.5) == gray(100)));

  assert(compose(BlendMode::Replace, base, src, 0.0) == src);
  assert(compose(BlendMode::Alpha, base, src, 0.0) == base);
  assert(compose(BlendMode::Add, base, src, 1.0) == add(base, src));
  assert(compose(BlendMode::Add, base, src, 0.0) == base);
  assert(compose(BlendMode::Screen, base, src, 1.0) == screen(base, src));
  assert(compose(BlendMode::Overlay, base, src, 1.0) == overlay(base, src));
  assert(compose(BlendMode::SoftLight, base, src, 1.0) == soft_light(base, src));
  assert((compose(BlendMode::Max, RGB{50, 200, 0}, RGB{100, 100, 100}, 1.0) == RGB{100, 200, 100}));
}

static void test_misc() {
  assert((grayscale(RGB{255, 0, 0}) == gray(76)));
  assert((grayscale(gray(255)) == gray(255)));
  assert((max(RGB{1, 9, 5}, RGB{4, 2, 5}) == RGB{4, 9, 5}));
  assert(std::strcmp(blend_mode_name(BlendMode::SoftLight), "softlight") == 0);
  assert(std::strcmp(blend_mode_name(BlendMode::Replace), "replace") == 0);
}

int main() {
  test_screen();
  test_add();
  test_lerp_scale();
  test_overlay_soft_light();
  test_alpha_compose();
  test_misc();
  return 0;
}
