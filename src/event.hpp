#pragma once
/*
 * Event
 *
 * Purpose: structured input events produced by ITerminal::poll_event.
 * Shape: type + key (special key or Key::Rune) + rune for printable input.
 * Closed/Error are the non-key, non-resize events.
 */
#include <cstdint>
#include <string>

enum class EventType : uint8_t { Key, Resize, Closed, Error };

enum class Key : uint16_t {
  None,
  Rune,
  Escape, Enter, Tab, Backtab, Backspace, Delete, Insert,
  Up, Down, Left, Right, Home, End, PageUp, PageDown,
  F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12,
  CtrlA, CtrlB, CtrlC, CtrlD, CtrlE, CtrlF, CtrlG, CtrlK, CtrlL, CtrlN, CtrlO,
  CtrlP, CtrlQ, CtrlR, CtrlS, CtrlT, CtrlU, CtrlV, CtrlW, CtrlX, CtrlY, CtrlZ,
  CtrlSpace, CtrlBackslash, CtrlBracketRight, CtrlCaret, CtrlUnderscore,
};

using Modifier = uint8_t;
inline constexpr Modifier ModNone  = 0;
inline constexpr Modifier ModShift = 1 << 0;
inline constexpr Modifier ModAlt   = 1 << 1;
inline constexpr Modifier ModCtrl  = 1 << 2;

struct Event {
  EventType type = EventType::Key;
  Key key = Key::None;
  char32_t rune = 0;
  Modifier mods = ModNone;
  int width = 0;
  int height = 0;
  std::string error;
};

const char* key_name(Key k);
