#pragma once
/*
 * Input
 *
 * Purpose: decode raw terminal bytes into Events with minimal state.
 * State: bytes of an unfinished escape or UTF-8 sequence carried to the next
 * feed(); a lone ESC is only reported by flush_pending() after a timeout.
 */
#include <string>
#include <string_view>
#include <vector>
#include "event.hpp"

class InputDecoder {
public:
  void feed(std::string_view bytes, std::vector<Event>& out);
  // Called when the escape timeout expires with bytes still pending.
  void flush_pending(std::vector<Event>& out);
  bool has_pending() const { return !pending_.empty(); }
  void reset() { pending_.clear(); }
private:
  // Returns bytes consumed from s, 0 when s is an incomplete prefix.
  size_t decode_one(std::string_view s, std::vector<Event>& out);
  size_t decode_escape(std::string_view s, std::vector<Event>& out);
  std::string pending_;
};
