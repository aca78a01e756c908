#pragma once
/*
 * Terminfo
 *
 * Purpose: probe the terminfo entry for $TERM (ncurses tinfo) and collect the
 * mode strings and color capability the ANSI surface needs.
 * Note: <term.h> defines capability-name macros; it is only included in
 * terminfo.cpp.
 */
#include <string>

struct TermCaps {
  std::string name;
  std::string enter_alt_screen;
  std::string exit_alt_screen;
  std::string hide_cursor;
  std::string show_cursor;
  int colors = 8;
  bool truecolor = false;
};

// Fills caps for the terminal on fd. Missing strings fall back to xterm sequences.
bool probe_terminfo(int fd, TermCaps& caps, std::string& msg);
