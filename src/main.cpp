#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <random>
#include <string>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include "ansi_terminal.hpp"
#include "color.hpp"
#include "config.hpp"
#include "log.hpp"
#include "render_buffer.hpp"
#include "terminal.hpp"

using Clock = std::chrono::steady_clock;

// Terminal cells are roughly twice as tall as wide.
static constexpr double kAspect = 2.1;
static constexpr int kStarCount = 100;

enum class BodyKind { Sun, Bubble, Pulse };

struct Body {
  double x, y, dx, dy, radius;
  RGB color;
  BodyKind kind;
};

struct Star {
  double x, y, brightness;
};

struct FrameTiming {
  std::chrono::nanoseconds composite{0};
  std::chrono::nanoseconds flush{0};
  double skipped_share = 0;
  long frames = 0;
};

static void scatter_stars(std::vector<Star>& stars, int w, int h, std::mt19937& rng) {
  std::uniform_real_distribution<double> ux(0.0, w), uy(0.0, h), ub(0.2, 1.0);
  for (auto& s : stars) s = {ux(rng), uy(rng), ub(rng)};
}

static void step_bodies(std::vector<Body>& bodies, int w, int h) {
  for (auto& b : bodies) {
    b.x += b.dx;
    b.y += b.dy;
    if (b.x < b.radius || b.x > w - b.radius) { b.dx = -b.dx; b.x += b.dx; }
    double ry = b.radius / kAspect;
    if (b.y < ry || b.y > h - ry) { b.dy = -b.dy; b.y += b.dy; }
  }
}

static void draw_background(RenderBuffer& rb) {
  int w = rb.width(), h = rb.height();
  for (int y = 0; y < h; ++y) {
    double gy = static_cast<double>(y) / h;
    RGB base{5, static_cast<uint8_t>(5 + gy * 10), static_cast<uint8_t>(15 + gy * 20)};
    for (int x = 0; x < w; ++x) rb.set(x, y, U' ', colors::LightGray, base, BlendMode::Replace, 1.0, AttrNone);
  }
}

static void draw_stars(RenderBuffer& rb, const std::vector<Star>& stars, double t) {
  for (const auto& s : stars) {
    int sx = static_cast<int>(s.x), sy = static_cast<int>(s.y);
    double brite = s.brightness * (0.8 + 0.2 * std::sin(t * 5.0 + s.x));
    uint8_t v = static_cast<uint8_t>(255 * brite);
    RGB star{v, v, v};
    rb.set(sx, sy, kNoGlyph, star, star, BlendMode::SoftLight, 1.0, AttrNone);
    rb.set(sx, sy, kNoGlyph, star, star, BlendMode::Add, brite, AttrNone);
  }
}

static void draw_body(RenderBuffer& rb, const Body& b, double t) {
  int min_x = static_cast<int>(b.x - b.radius - 1);
  int max_x = static_cast<int>(b.x + b.radius + 1);
  int min_y = static_cast<int>(b.y - b.radius / kAspect - 1);
  int max_y = static_cast<int>(b.y + b.radius / kAspect + 1);
  double rad_sq = b.radius * b.radius;
  for (int y = min_y; y < max_y; ++y) {
    double dy = (y - b.y) * kAspect;
    for (int x = min_x; x < max_x; ++x) {
      if (!rb.in_bounds(x, y)) continue;
      double dx = x - b.x;
      double dist_sq = dx * dx + dy * dy;
      if (dist_sq > rad_sq) continue;
      double nd = std::sqrt(dist_sq) / b.radius;
      switch (b.kind) {
        case BodyKind::Sun: {
          double core = std::max(0.0, 1.0 - nd * 2.0);
          double corona = (1.0 - nd) * (1.0 - nd);
          double noise = std::sin(nd * 20.0 - t * 4.0) * 0.1;
          RGB val = scale(b.color, corona + noise);
          if (core > 0) val = add(val, scale(colors::White, core));
          rb.set(x, y, kNoGlyph, val, val, BlendMode::Add, 1.0, AttrNone);
          break;
        }
        case BodyKind::Bubble: {
          double rim = nd * nd * nd;
          double body = std::sqrt(1.0 - nd);
          RGB col = scale(b.color, body * 0.6 + rim * 0.8);
          rb.set(x, y, kNoGlyph, col, col, BlendMode::Overlay, 1.0, AttrNone);
          if (nd > 0.85) {
            RGB edge{200, 255, 255};
            rb.set(x, y, kNoGlyph, edge, edge, BlendMode::Screen, (nd - 0.85) * 6.0, AttrNone);
          }
          break;
        }
        case BodyKind::Pulse: {
          double ripple = std::sin(nd * 30.0 - t * 8.0);
          double a = (1.0 - nd) * (0.5 + 0.5 * ripple);
          RGB col = scale(b.color, a);
          rb.set(x, y, kNoGlyph, col, col, BlendMode::Screen, 1.0, AttrNone);
          break;
        }
      }
    }
  }
}

static bool is_quit_key(const Event& ev) {
  if (ev.type != EventType::Key) return false;
  if (ev.key == Key::Escape || ev.key == Key::CtrlC) return true;
  return ev.key == Key::Rune && (ev.rune == U'q' || ev.rune == U'Q');
}

static double to_ms(std::chrono::nanoseconds d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

int main(int argc, char** argv) {
  double seconds = 20.0;
  if (argc >= 2) {
    char* end = nullptr;
    seconds = std::strtod(argv[1], &end);
    if (end == argv[1] || *end != '\0' || seconds <= 0) {
      std::fprintf(stderr, "usage: %s [seconds]\n", argv[0]);
      return 2;
    }
  }

  Config cfg;
  std::string msg;
  if (!load_config(cfg, msg)) std::fprintf(stderr, "lumen: config: %s\n", msg.c_str());
  msg.clear();
  if (!init_logging(cfg, msg)) std::fprintf(stderr, "lumen: %s\n", msg.c_str());

  AnsiTerminal term(cfg);
  std::atomic<bool> quit{false};
  ShutdownWatcher watcher(term, [&quit](int){ quit.store(true); });
  msg.clear();
  if (!watcher.start(msg)) spdlog::warn("shutdown watcher not started: {}", msg);

  msg.clear();
  if (!term.init(msg)) {
    std::fprintf(stderr, "lumen: %s\n", msg.c_str());
    return 1;
  }
  TerminalGuard guard(term);

  std::thread input([&]{
    for (;;) {
      Event ev = term.poll_event();
      if (ev.type == EventType::Closed) break;
      if (ev.type == EventType::Error) {
        spdlog::error("input: {}", ev.error);
        term.fini();
        quit.store(true);
        break;
      }
      if (is_quit_key(ev)) {
        term.fini();
        quit.store(true);
        break;
      }
    }
  });

  std::mt19937 rng(std::random_device{}());
  std::vector<Body> bodies = {
    {20, 10, 0.8, 0.4, 14, {255, 160, 60}, BodyKind::Sun},
    {60, 20, -0.6, 0.7, 18, {60, 220, 255}, BodyKind::Bubble},
    {40, 30, 0.4, -0.5, 22, {200, 60, 255}, BodyKind::Pulse},
  };
  std::vector<Star> stars(kStarCount);
  TermSize sz = term.get_size();
  RenderBuffer rb(sz.width, sz.height);
  scatter_stars(stars, sz.width, sz.height, rng);
  Frame frame;

  FrameTiming timing;
  bool write_failed = false;
  const auto frame_budget = cfg.fps > 0 ? std::chrono::nanoseconds(1000000000LL / cfg.fps)
                                        : std::chrono::nanoseconds(0);
  const auto start = Clock::now();
  const auto deadline = start + std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(seconds));

  while (!quit.load() && Clock::now() < deadline) {
    auto frame_start = Clock::now();
    double t = std::chrono::duration<double>(frame_start - start).count();

    TermSize now = term.get_size();
    if (now.width != rb.width() || now.height != rb.height()) {
      rb.resize(now.width, now.height);
      scatter_stars(stars, now.width, now.height, rng);
    }
    step_bodies(bodies, rb.width(), rb.height());

    auto t0 = Clock::now();
    draw_background(rb);
    draw_stars(rb, stars, t);
    for (const auto& b : bodies) draw_body(rb, b, t);
    rb.resolve_into(frame);
    auto t1 = Clock::now();
    if (!term.flush(frame, rb.width(), rb.height(), msg)) {
      spdlog::error("flush failed: {}", msg);
      write_failed = true;
      break;
    }
    auto t2 = Clock::now();

    FlushStats st = term.last_flush_stats();
    timing.composite += t1 - t0;
    timing.flush += t2 - t1;
    if (st.cells > 0) timing.skipped_share += 1.0 - static_cast<double>(st.cells_written) / st.cells;
    timing.frames++;

    auto elapsed = Clock::now() - frame_start;
    if (elapsed < frame_budget) std::this_thread::sleep_for(frame_budget - elapsed);
  }

  term.fini();
  input.join();
  watcher.stop();

  if (write_failed) {
    std::fprintf(stderr, "lumen: terminal write failed: %s\n", msg.c_str());
    return 1;
  }
  double total = std::chrono::duration<double>(Clock::now() - start).count();
  long frames = timing.frames;
  std::printf("\n=== Visual Benchmark Results ===\n");
  std::printf("Resolution:   %dx%d (%d cells)\n", rb.width(), rb.height(), rb.width() * rb.height());
  std::printf("Total Frames: %ld\n", frames);
  std::printf("Total Time:   %.2fs\n", total);
  std::printf("Average FPS:  %.2f\n", frames / total);
  std::printf("------------------------------\n");
  if (frames > 0) {
    std::printf("Avg Composite: %.3f ms\n", to_ms(timing.composite) / frames);
    std::printf("Avg Flush:     %.3f ms\n", to_ms(timing.flush) / frames);
    std::printf("Avg Skipped:   %.1f%%\n", 100.0 * timing.skipped_share / frames);
  }
  return 0;
}
