#include "output_buffer.hpp"
#include "render_buffer.hpp"
#include <cassert>
#include <string>

static const Cell A{U'A', colors::Gray, colors::Black, AttrNone};
static const Cell X{U'X', colors::White, colors::Black, AttrNone};
static const std::string kWhiteOnBlack = "\x1b[0;38;2;255;255;255;48;2;0;0;0m";

static Frame row_of(const Cell& c, int n) { return Frame(static_cast<size_t>(n), c); }

static void test_single_cell_diff() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f1 = row_of(A, 3);
  assert(ob.flush(f1, 3, 1, msg));
  assert(ob.last_stats().full_redraw);
  assert(ob.last_stats().cells_written == 3);

  sink.reset();
  Frame f2 = f1;
  f2[1] = X;
  assert(ob.flush(f2, 3, 1, msg));
  assert(sink.write_count() == 1);
  assert(sink.data() == "\x1b[1;2H" + kWhiteOnBlack + "X\x1b[0m");
  const FlushStats& st = ob.last_stats();
  assert(!st.full_redraw);
  assert(st.cells == 3);
  assert(st.cells_written == 1);
  assert(st.runs == 1);
  assert(st.bytes == sink.data().size());
}

static void test_idempotent() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(A, 8);
  f[3] = X;
  assert(ob.flush(f, 4, 2, msg));
  size_t writes = sink.write_count();
  size_t bytes = sink.data().size();
  assert(ob.flush(f, 4, 2, msg));
  assert(sink.write_count() == writes);
  assert(sink.data().size() == bytes);
  assert(ob.last_stats().bytes == 0);
  assert(ob.last_stats().cells_written == 0);
  assert(ob.last_stats().runs == 0);
}

static void test_runs_and_cursor() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(A, 6);
  assert(ob.flush(f, 6, 1, msg));
  sink.reset();

  // Adjacent changes coalesce into one run.
  f[1] = X; f[2] = X;
  assert(ob.flush(f, 6, 1, msg));
  assert(ob.last_stats().runs == 1);
  assert(sink.data() == "\x1b[1;2H" + kWhiteOnBlack + "XX\x1b[0m");

  // A gap to the right on the same row moves with CUF.
  sink.reset();
  Frame g = f;
  g[1] = A; g[4] = A;
  g[1].rune = U'Y';
  g[4].rune = U'Z';
  assert(ob.flush(g, 6, 1, msg));
  assert(ob.last_stats().runs == 2);
  const std::string gray_on_black = "\x1b[0;38;2;120;120;120;48;2;0;0;0m";
  assert(sink.data() == "\x1b[1;2H" + gray_on_black + "Y\x1b[2CZ\x1b[0m");
}

static void test_rows_use_cup() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(A, 4);
  assert(ob.flush(f, 2, 2, msg));
  sink.reset();
  f[0] = X;
  f[3] = X;
  assert(ob.flush(f, 2, 2, msg));
  assert(sink.data() == "\x1b[1;1H" + kWhiteOnBlack + "X\x1b[2;2HX\x1b[0m");
}

static void test_style_coalescing() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(X, 3);
  f[1].fg = colors::Red;
  f[2].fg = colors::Red;
  f[2].bg = colors::Blue;
  assert(ob.flush(f, 3, 1, msg));
  assert(sink.data() == "\x1b[1;1H" + kWhiteOnBlack + "X" +
                        "\x1b[38;2;255;0;0mX" +
                        "\x1b[48;2;0;0;255mX\x1b[0m");

  sink.reset();
  Frame g = row_of(X, 3);
  g[1].attrs = AttrBold | AttrUnderline;
  assert(ob.flush(g, 3, 1, msg));
  assert(sink.data() == "\x1b[1;2H" +
                        std::string("\x1b[0;1;4;38;2;255;255;255;48;2;0;0;0mX") +
                        kWhiteOnBlack + "X\x1b[0m");
}

static void test_palette_mode() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::Palette256);
  std::string msg;
  Frame f = row_of(X, 1);
  assert(ob.flush(f, 1, 1, msg));
  assert(sink.data() == "\x1b[1;1H\x1b[0;38;5;15;48;5;0mX\x1b[0m");

  // Raw palette indexes pass through in any mode.
  StringSink sink2;
  OutputBuffer tc(sink2, ColorMode::TrueColor);
  Cell c = X;
  c.fg = RGB{208, 0, 0};
  c.attrs = AttrFg256;
  Frame g = row_of(c, 1);
  assert(tc.flush(g, 1, 1, msg));
  assert(sink2.data() == "\x1b[1;1H\x1b[0;38;5;208;48;2;0;0;0mX\x1b[0m");

  sink.reset();
  ob.set_color_mode(ColorMode::TrueColor);
  assert(ob.flush(f, 1, 1, msg));
  assert(ob.last_stats().full_redraw);
  assert(sink.data() == "\x1b[1;1H" + kWhiteOnBlack + "X\x1b[0m");
}

static void test_glyphs() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(X, 2);
  f[0].rune = kNoGlyph;
  f[1].rune = U'é';
  assert(ob.flush(f, 2, 1, msg));
  assert(sink.data() == "\x1b[1;1H" + kWhiteOnBlack + " \xC3\xA9\x1b[0m");

  // After a possibly wide glyph the next run is placed absolutely.
  Frame g = row_of(A, 4);
  assert(ob.flush(g, 4, 1, msg));
  sink.reset();
  g[0] = X;
  g[0].rune = U'日';
  g[2] = X;
  assert(ob.flush(g, 4, 1, msg));
  assert(sink.data() == "\x1b[1;1H" + kWhiteOnBlack + "\xE6\x97\xA5\x1b[1;3HX\x1b[0m");

  // Narrow glyphs keep the relative move.
  sink.reset();
  g[0].rune = U'é';
  g[2].rune = U'Y';
  assert(ob.flush(g, 4, 1, msg));
  assert(sink.data() == "\x1b[1;1H" + kWhiteOnBlack + "\xC3\xA9\x1b[1CY\x1b[0m");
}

static void test_resize_full_redraw() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(A, 3);
  assert(ob.flush(f, 3, 1, msg));
  Frame big = row_of(A, 8);
  assert(ob.flush(big, 4, 2, msg));
  assert(ob.width() == 4 && ob.height() == 2);
  assert(ob.last_stats().full_redraw);
  assert(ob.last_stats().cells_written == 8);
  Frame small = row_of(A, 2);
  assert(ob.flush(small, 1, 2, msg));
  assert(ob.last_stats().full_redraw);
  assert(ob.last_stats().cells_written == 2);
}

static void test_short_frame_dropped() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(A, 3);
  assert(ob.flush(f, 3, 1, msg));
  sink.reset();
  Frame short_frame = row_of(X, 2);
  assert(ob.flush(short_frame, 3, 1, msg));
  assert(sink.write_count() == 0);
  assert(ob.flush(f, 3, 1, msg));
  assert(ob.last_stats().full_redraw);
  assert(ob.last_stats().cells_written == 3);

  // Dimensions far beyond the frame leave the cache at its old size.
  sink.reset();
  assert(ob.flush(short_frame, 200000, 200000, msg));
  assert(sink.write_count() == 0);
  assert(ob.width() == 3 && ob.height() == 1);
  assert(ob.flush(f, 3, 1, msg));
  assert(ob.last_stats().full_redraw);
  assert(ob.last_stats().cells_written == 3);
}

static void test_write_failure() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  Frame f = row_of(A, 3);
  assert(ob.flush(f, 3, 1, msg));
  Frame g = f;
  g[0] = X;
  sink.set_fail(true);
  assert(!ob.flush(g, 3, 1, msg));
  assert(msg.find("Broken pipe") != std::string::npos);
  sink.set_fail(false);
  sink.reset();
  assert(ob.flush(g, 3, 1, msg));
  assert(ob.last_stats().full_redraw);
  assert(ob.last_stats().cells_written == 3);
}

static void test_clear_and_cursor() {
  StringSink sink;
  OutputBuffer ob(sink, ColorMode::TrueColor);
  std::string msg;
  ob.resize(3, 1);
  assert(ob.clear_screen(RGB{1, 2, 3}, msg));
  assert(sink.data() == "\x1b[0m\x1b[48;2;1;2;3m\x1b[2J\x1b[0m");

  sink.reset();
  Cell blank = RenderBuffer::kBlankCell;
  blank.bg = RGB{1, 2, 3};
  Frame f = row_of(blank, 3);
  assert(ob.flush(f, 3, 1, msg));
  assert(sink.write_count() == 0);

  assert(ob.move_cursor(2, 0, msg));
  assert(sink.data() == "\x1b[1;3H");
  sink.reset();
  assert(ob.write_raw("\x1b[?25h", msg));
  assert(sink.data() == "\x1b[?25h");
}

int main() {
  test_single_cell_diff();
  test_idempotent();
  test_runs_and_cursor();
  test_rows_use_cup();
  test_style_coalescing();
  test_palette_mode();
  test_glyphs();
  test_resize_full_redraw();
  test_short_frame_dropped();
  test_write_failure();
  test_clear_and_cursor();
  return 0;
}
