#include "input.hpp"
#include <cassert>
#include <cstring>
#include <string>
#include <vector>

static std::vector<Event> decode(const std::string& bytes) {
  InputDecoder d;
  std::vector<Event> out;
  d.feed(bytes, out);
  d.flush_pending(out);
  return out;
}

static bool is_key(const Event& ev, Key k, Modifier mods = ModNone) {
  return ev.type == EventType::Key && ev.key == k && ev.mods == mods;
}

static bool is_rune(const Event& ev, char32_t r, Modifier mods = ModNone) {
  return is_key(ev, Key::Rune, mods) && ev.rune == r;
}

static void test_printable_and_controls() {
  auto evs = decode("aZ ~");
  assert(evs.size() == 4);
  assert(is_rune(evs[0], U'a'));
  assert(is_rune(evs[1], U'Z'));
  assert(is_rune(evs[2], U' '));
  assert(is_rune(evs[3], U'~'));

  evs = decode(std::string("\x03\x7f\x08\x09\x0d\x0a\x01\x1a", 8));
  assert(evs.size() == 8);
  assert(is_key(evs[0], Key::CtrlC));
  assert(is_key(evs[1], Key::Backspace));
  assert(is_key(evs[2], Key::Backspace));
  assert(is_key(evs[3], Key::Tab));
  assert(is_key(evs[4], Key::Enter));
  assert(is_key(evs[5], Key::Enter));
  assert(is_key(evs[6], Key::CtrlA));
  assert(is_key(evs[7], Key::CtrlZ));

  evs = decode(std::string("\0", 1));
  assert(evs.size() == 1 && is_key(evs[0], Key::CtrlSpace));
}

static void test_utf8() {
  auto evs = decode("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x98\x80");
  assert(evs.size() == 3);
  assert(is_rune(evs[0], U'é'));
  assert(is_rune(evs[1], U'€'));
  assert(is_rune(evs[2], U'\U0001F600'));

  // A sequence split across reads is reassembled.
  InputDecoder d;
  std::vector<Event> out;
  d.feed("\xE2\x82", out);
  assert(out.empty());
  assert(d.has_pending());
  d.feed("\xAC", out);
  assert(out.size() == 1 && is_rune(out[0], U'€'));
  assert(!d.has_pending());

  evs = decode("\xFFx");
  assert(evs.size() == 2);
  assert(is_rune(evs[0], 0xFFFD));
  assert(is_rune(evs[1], U'x'));
}

static void test_csi_ss3() {
  auto evs = decode("\x1b[A\x1b[B\x1b[C\x1b[D\x1b[H\x1b[F\x1b[Z");
  assert(evs.size() == 7);
  assert(is_key(evs[0], Key::Up));
  assert(is_key(evs[1], Key::Down));
  assert(is_key(evs[2], Key::Right));
  assert(is_key(evs[3], Key::Left));
  assert(is_key(evs[4], Key::Home));
  assert(is_key(evs[5], Key::End));
  assert(is_key(evs[6], Key::Backtab, ModShift));

  evs = decode("\x1bOA\x1bOP\x1bOS\x1bOH");
  assert(evs.size() == 4);
  assert(is_key(evs[0], Key::Up));
  assert(is_key(evs[1], Key::F1));
  assert(is_key(evs[2], Key::F4));
  assert(is_key(evs[3], Key::Home));

  evs = decode("\x1b[2~\x1b[3~\x1b[5~\x1b[6~\x1b[15~\x1b[24~\x1b[1~\x1b[4~");
  assert(evs.size() == 8);
  assert(is_key(evs[0], Key::Insert));
  assert(is_key(evs[1], Key::Delete));
  assert(is_key(evs[2], Key::PageUp));
  assert(is_key(evs[3], Key::PageDown));
  assert(is_key(evs[4], Key::F5));
  assert(is_key(evs[5], Key::F12));
  assert(is_key(evs[6], Key::Home));
  assert(is_key(evs[7], Key::End));
}

static void test_modifiers() {
  auto evs = decode("\x1b[1;5C\x1b[1;2A\x1b[3;3~\x1b[1;8D");
  assert(evs.size() == 4);
  assert(is_key(evs[0], Key::Right, ModCtrl));
  assert(is_key(evs[1], Key::Up, ModShift));
  assert(is_key(evs[2], Key::Delete, ModAlt));
  assert(is_key(evs[3], Key::Left, ModShift | ModAlt | ModCtrl));

  evs = decode("\x1b" "x");
  assert(evs.size() == 1 && is_rune(evs[0], U'x', ModAlt));
}

static void test_escape_timeout() {
  InputDecoder d;
  std::vector<Event> out;
  d.feed("\x1b", out);
  assert(out.empty());
  assert(d.has_pending());
  // Continuation within the timeout completes the sequence.
  d.feed("[B", out);
  assert(out.size() == 1 && is_key(out[0], Key::Down));

  out.clear();
  d.feed("\x1b", out);
  d.flush_pending(out);
  assert(out.size() == 1 && is_key(out[0], Key::Escape));
  assert(!d.has_pending());

  out.clear();
  d.feed("\x1b[", out);
  assert(out.empty());
  d.flush_pending(out);
  assert(out.size() == 2);
  assert(is_key(out[0], Key::Escape));
  assert(is_rune(out[1], U'['));

  out.clear();
  d.feed("\x1b\x1b[A", out);
  assert(out.size() == 2);
  assert(is_key(out[0], Key::Escape));
  assert(is_key(out[1], Key::Up));
}

static void test_unknown_sequences() {
  auto evs = decode("\x1b[99~q\x1b[<0;1;1Mw");
  assert(evs.size() == 2);
  assert(is_rune(evs[0], U'q'));
  assert(is_rune(evs[1], U'w'));

  // Oversized parameters are rejected without overflowing.
  evs = decode("\x1b[99999999999~a\x1b[1;99999999999Ab");
  assert(evs.size() == 2);
  assert(is_rune(evs[0], U'a'));
  assert(is_rune(evs[1], U'b'));
  evs = decode("\x1b[9999~\x1b[1;9999A");
  assert(evs.size() == 1 && evs[0].key == Key::Up);
}

static void test_key_names() {
  assert(std::strcmp(key_name(Key::F10), "F10") == 0);
  assert(std::strcmp(key_name(Key::CtrlC), "Ctrl+C") == 0);
  assert(std::strcmp(key_name(Key::CtrlZ), "Ctrl+Z") == 0);
  assert(std::strcmp(key_name(Key::PageDown), "PageDown") == 0);
}

int main() {
  test_printable_and_controls();
  test_utf8();
  test_csi_ss3();
  test_modifiers();
  test_escape_timeout();
  test_unknown_sequences();
  test_key_names();
  return 0;
}
