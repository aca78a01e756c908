#include "terminfo.hpp"
#include <cstdlib>
#include <curses.h>
#include <term.h>

static std::string string_cap(const char* cap, const char* fallback) {
  const char* s = tigetstr(cap);
  if (s == nullptr || s == reinterpret_cast<const char*>(-1)) return fallback;
  return s;
}

bool probe_terminfo(int fd, TermCaps& caps, std::string& msg) {
  int err = 0;
  if (setupterm(nullptr, fd, &err) != OK) {
    const char* term = std::getenv("TERM");
    if (err == 0) msg = std::string("no terminfo entry for TERM=") + (term ? term : "(unset)");
    else if (err == 1) msg = "terminal is hardcopy, cannot be used";
    else msg = "terminfo database not found";
    return false;
  }
  const char* term = std::getenv("TERM");
  caps.name = term ? term : "";
  caps.enter_alt_screen = string_cap("smcup", "\x1b[?1049h");
  caps.exit_alt_screen = string_cap("rmcup", "\x1b[?1049l");
  caps.hide_cursor = string_cap("civis", "\x1b[?25l");
  caps.show_cursor = string_cap("cnorm", "\x1b[?25h");
  int colors = tigetnum("colors");
  caps.colors = colors > 0 ? colors : 8;
  caps.truecolor = tigetflag("Tc") > 0 || tigetflag("RGB") > 0;
  del_curterm(cur_term);
  return true;
}
