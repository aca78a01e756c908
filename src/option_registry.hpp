#pragma once
/*
 * OptionRegistry
 *
 * Purpose: register and dispatch rc/env options.
 * Design: map name -> handler(cfg, value, msg); config.cpp parses the line and routes.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <vector>
#include "config.hpp"

class OptionRegistry {
public:
  using Handler = std::function<bool(Config&, const std::string&, std::string&)>;
  void register_option(const std::string& name, Handler h) { map_[name] = std::move(h); }
  // Returns false with msg for an unknown name or a rejected value.
  bool apply(Config& cfg, const std::string& name, const std::string& value, std::string& msg) const {
    auto it = map_.find(name);
    if (it == map_.end()) { msg = "unknown option: " + name; return false; }
    return it->second(cfg, value, msg);
  }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.first);
    return out;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
