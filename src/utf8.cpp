#include "utf8.hpp"

size_t utf8_decode(std::string_view s, char32_t& cp) {
  if (s.empty()) return 0;
  unsigned char b = static_cast<unsigned char>(s[0]);
  if (b < 0x80) { cp = b; return 1; }
  size_t size = 0;
  char32_t min = 0;
  char32_t r = 0;
  if ((b & 0xE0) == 0xC0) { size = 2; min = 0x80; r = b & 0x1F; }
  else if ((b & 0xF0) == 0xE0) { size = 3; min = 0x800; r = b & 0x0F; }
  else if ((b & 0xF8) == 0xF0) { size = 4; min = 0x10000; r = b & 0x07; }
  else { cp = kReplacementChar; return 1; }
  for (size_t i = 1; i < size; ++i) {
    if (i >= s.size()) return 0;
    unsigned char c = static_cast<unsigned char>(s[i]);
    if ((c & 0xC0) != 0x80) { cp = kReplacementChar; return 1; }
    r = (r << 6) | (c & 0x3F);
  }
  if (r < min || r > 0x10FFFF || (r >= 0xD800 && r <= 0xDFFF)) { cp = kReplacementChar; return 1; }
  cp = r;
  return size;
}

void utf8_append(std::string& out, char32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    utf8_append(out, kReplacementChar);
  }
}
