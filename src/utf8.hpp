#pragma once
/*
 * UTF-8 helpers shared by the input decoder, RenderBuffer::set_string and
 * the flush engine.
 */
#include <string>
#include <string_view>

inline constexpr char32_t kReplacementChar = 0xFFFD;

// Decodes the first code point of s into cp. Returns bytes consumed, or 0 when
// s ends inside a valid multi-byte prefix. Invalid input yields U+FFFD and 1.
size_t utf8_decode(std::string_view s, char32_t& cp);
void utf8_append(std::string& out, char32_t cp);
