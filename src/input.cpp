#include "input.hpp"
#include <algorithm>
#include "utf8.hpp"

static constexpr char kEsc = 0x1b;
// Longest CSI we try to match before giving up on it.
static constexpr size_t kMaxCsi = 16;

static Event key_event(Key k, Modifier mods = ModNone) {
  Event ev;
  ev.type = EventType::Key;
  ev.key = k;
  ev.mods = mods;
  return ev;
}

static Event rune_event(char32_t r, Modifier mods = ModNone) {
  Event ev = key_event(Key::Rune, mods);
  ev.rune = r;
  return ev;
}

static Key control_key(unsigned char b) {
  switch (b) {
    case 0x00: return Key::CtrlSpace;
    case 0x01: return Key::CtrlA;
    case 0x02: return Key::CtrlB;
    case 0x03: return Key::CtrlC;
    case 0x04: return Key::CtrlD;
    case 0x05: return Key::CtrlE;
    case 0x06: return Key::CtrlF;
    case 0x07: return Key::CtrlG;
    case 0x08: return Key::Backspace;
    case 0x09: return Key::Tab;
    case 0x0a:
    case 0x0d: return Key::Enter;
    case 0x0b: return Key::CtrlK;
    case 0x0c: return Key::CtrlL;
    case 0x0e: return Key::CtrlN;
    case 0x0f: return Key::CtrlO;
    case 0x10: return Key::CtrlP;
    case 0x11: return Key::CtrlQ;
    case 0x12: return Key::CtrlR;
    case 0x13: return Key::CtrlS;
    case 0x14: return Key::CtrlT;
    case 0x15: return Key::CtrlU;
    case 0x16: return Key::CtrlV;
    case 0x17: return Key::CtrlW;
    case 0x18: return Key::CtrlX;
    case 0x19: return Key::CtrlY;
    case 0x1a: return Key::CtrlZ;
    case 0x1b: return Key::Escape;
    case 0x1c: return Key::CtrlBackslash;
    case 0x1d: return Key::CtrlBracketRight;
    case 0x1e: return Key::CtrlCaret;
    case 0x1f: return Key::CtrlUnderscore;
    default: return Key::None;
  }
}

static Key letter_key(char final) {
  switch (final) {
    case 'A': return Key::Up;
    case 'B': return Key::Down;
    case 'C': return Key::Right;
    case 'D': return Key::Left;
    case 'H': return Key::Home;
    case 'F': return Key::End;
    case 'P': return Key::F1;
    case 'Q': return Key::F2;
    case 'R': return Key::F3;
    case 'S': return Key::F4;
    case 'Z': return Key::Backtab;
    default: return Key::None;
  }
}

static Key tilde_key(int code) {
  switch (code) {
    case 1: case 7: return Key::Home;
    case 2: return Key::Insert;
    case 3: return Key::Delete;
    case 4: case 8: return Key::End;
    case 5: return Key::PageUp;
    case 6: return Key::PageDown;
    case 11: return Key::F1;
    case 12: return Key::F2;
    case 13: return Key::F3;
    case 14: return Key::F4;
    case 15: return Key::F5;
    case 17: return Key::F6;
    case 18: return Key::F7;
    case 19: return Key::F8;
    case 20: return Key::F9;
    case 21: return Key::F10;
    case 23: return Key::F11;
    case 24: return Key::F12;
    default: return Key::None;
  }
}

// xterm encodes modifiers as 1 + (shift|alt<<1|ctrl<<2).
static Modifier xterm_modifier(int param) {
  if (param < 2) return ModNone;
  return static_cast<Modifier>((param - 1) & (ModShift | ModAlt | ModCtrl));
}

// Longer parameters are not keys; the cap keeps accumulation from overflowing.
static constexpr int kMaxCsiParam = 9999;

// params is the text between "ESC [" and the final byte.
static bool parse_csi(std::string_view params, char final, Event& ev) {
  int p[2] = {0, 0};
  int n = 0;
  for (char c : params) {
    if (c == ';') {
      if (++n > 1) return false;
    } else if (c >= '0' && c <= '9') {
      p[n] = p[n] * 10 + (c - '0');
      if (p[n] > kMaxCsiParam) return false;
    } else {
      return false;
    }
  }
  Key k = final == '~' ? tilde_key(p[0]) : letter_key(final);
  if (k == Key::None) return false;
  Modifier mods = xterm_modifier(p[1]);
  if (k == Key::Backtab) mods |= ModShift;
  ev = key_event(k, mods);
  return true;
}

size_t InputDecoder::decode_escape(std::string_view s, std::vector<Event>& out) {
  if (s.size() < 2) return 0;
  char second = s[1];
  if (second == '[') {
    size_t end = 2;
    size_t limit = std::min(s.size(), kMaxCsi);
    while (end < limit) {
      unsigned char b = static_cast<unsigned char>(s[end]);
      if (b >= 0x40 && b <= 0x7e) break;
      if (b < 0x20 || b > 0x3f) {
        out.push_back(key_event(Key::Escape));
        return 1;
      }
      end++;
    }
    if (end >= limit) {
      if (s.size() < kMaxCsi) return 0;
      out.push_back(key_event(Key::Escape));
      return 1;
    }
    Event ev;
    // Unknown but well-formed sequences are consumed silently.
    if (parse_csi(s.substr(2, end - 2), s[end], ev)) out.push_back(ev);
    return end + 1;
  }
  if (second == 'O') {
    if (s.size() < 3) return 0;
    Key k = letter_key(s[2]);
    if (k != Key::None) out.push_back(key_event(k));
    return 3;
  }
  unsigned char b = static_cast<unsigned char>(second);
  if (b >= 0x20 && b < 0x7f) {
    out.push_back(rune_event(b, ModAlt));
    return 2;
  }
  out.push_back(key_event(Key::Escape));
  return 1;
}

size_t InputDecoder::decode_one(std::string_view s, std::vector<Event>& out) {
  unsigned char b = static_cast<unsigned char>(s[0]);
  if (b >= 0x20 && b < 0x7f) { out.push_back(rune_event(b)); return 1; }
  if (b == kEsc) return decode_escape(s, out);
  if (b == 0x7f) { out.push_back(key_event(Key::Backspace)); return 1; }
  if (b < 0x20) { out.push_back(key_event(control_key(b))); return 1; }
  char32_t cp = kReplacementChar;
  size_t n = utf8_decode(s, cp);
  if (n == 0) return 0;
  out.push_back(rune_event(cp));
  return n;
}

void InputDecoder::feed(std::string_view bytes, std::vector<Event>& out) {
  pending_.append(bytes);
  size_t i = 0;
  while (i < pending_.size()) {
    size_t n = decode_one(std::string_view(pending_).substr(i), out);
    if (n == 0) break;
    i += n;
  }
  pending_.erase(0, i);
}

void InputDecoder::flush_pending(std::vector<Event>& out) {
  while (!pending_.empty()) {
    if (pending_[0] == kEsc) out.push_back(key_event(Key::Escape));
    else out.push_back(rune_event(kReplacementChar));
    std::string rest = pending_.substr(1);
    pending_.clear();
    feed(rest, out);
  }
}

const char* key_name(Key k) {
  switch (k) {
    case Key::None: return "None";
    case Key::Rune: return "Rune";
    case Key::Escape: return "Escape";
    case Key::Enter: return "Enter";
    case Key::Tab: return "Tab";
    case Key::Backtab: return "Backtab";
    case Key::Backspace: return "Backspace";
    case Key::Delete: return "Delete";
    case Key::Insert: return "Insert";
    case Key::Up: return "Up";
    case Key::Down: return "Down";
    case Key::Left: return "Left";
    case Key::Right: return "Right";
    case Key::Home: return "Home";
    case Key::End: return "End";
    case Key::PageUp: return "PageUp";
    case Key::PageDown: return "PageDown";
    case Key::CtrlSpace: return "Ctrl+Space";
    case Key::CtrlBackslash: return "Ctrl+\\";
    case Key::CtrlBracketRight: return "Ctrl+]";
    case Key::CtrlCaret: return "Ctrl+^";
    case Key::CtrlUnderscore: return "Ctrl+_";
    default: break;
  }
  if (k >= Key::F1 && k <= Key::F12) {
    static const char* fkeys[] = {"F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12"};
    return fkeys[static_cast<int>(k) - static_cast<int>(Key::F1)];
  }
  // Ctrl+H/I/J/M arrive as Backspace/Tab/Enter.
  static const char* ctrl[] = {"Ctrl+A", "Ctrl+B", "Ctrl+C", "Ctrl+D", "Ctrl+E", "Ctrl+F", "Ctrl+G",
                               "Ctrl+K", "Ctrl+L", "Ctrl+N", "Ctrl+O", "Ctrl+P", "Ctrl+Q", "Ctrl+R",
                               "Ctrl+S", "Ctrl+T", "Ctrl+U", "Ctrl+V", "Ctrl+W", "Ctrl+X", "Ctrl+Y", "Ctrl+Z"};
  if (k >= Key::CtrlA && k <= Key::CtrlZ) return ctrl[static_cast<int>(k) - static_cast<int>(Key::CtrlA)];
  return "Unknown";
}
