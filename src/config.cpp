#include "config.hpp"
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <vector>
#include "file_reader.hpp"
#include "option_registry.hpp"

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return (j > i) ? s.substr(i, j - i) : std::string();
}

static bool parse_int(const std::string& v, int lo, int& out) {
  int n = 0;
  auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), n);
  if (ec != std::errc() || p != v.data() + v.size() || n < lo) return false;
  out = n;
  return true;
}

static bool parse_color(const std::string& v, int& out) {
  if (v == "auto") { out = LUMEN_COLOR_AUTO; return true; }
  if (v == "256") { out = LUMEN_COLOR_256; return true; }
  if (v == "truecolor" || v == "24bit") { out = LUMEN_COLOR_TRUECOLOR; return true; }
  return false;
}

static bool is_level_name(const std::string& v) {
  static const char* const kLevels[] = {"trace", "debug", "info", "warn", "warning",
                                        "err", "error", "critical", "off"};
  for (const char* l : kLevels) if (v == l) return true;
  return false;
}

static const OptionRegistry& registry() {
  static const OptionRegistry reg = []{
    OptionRegistry r;
    r.register_option("color", [](Config& c, const std::string& v, std::string& msg){
      if (!parse_color(v, c.color)) { msg = "color: expected auto, truecolor or 256, got '" + v + "'"; return false; }
      return true;
    });
    r.register_option("fps", [](Config& c, const std::string& v, std::string& msg){
      if (!parse_int(v, 0, c.fps)) { msg = "fps: expected a non-negative integer, got '" + v + "'"; return false; }
      return true;
    });
    r.register_option("escape_timeout", [](Config& c, const std::string& v, std::string& msg){
      if (!parse_int(v, 1, c.escape_timeout_ms)) { msg = "escape_timeout: expected milliseconds > 0, got '" + v + "'"; return false; }
      return true;
    });
    r.register_option("log", [](Config& c, const std::string& v, std::string&){
      c.log_file = v;
      return true;
    });
    r.register_option("loglevel", [](Config& c, const std::string& v, std::string& msg){
      if (!is_level_name(v)) { msg = "loglevel: unknown level '" + v + "'"; return false; }
      c.log_level = v;
      return true;
    });
    return r;
  }();
  return reg;
}

bool apply_option(Config& cfg, const std::string& line, std::string& msg) {
  std::string s = trim(line);
  if (s.empty()) return true;
  if (s[0] == '#' || s[0] == '"') return true;
  if (s.size() >= 2 && s[0] == '/' && s[1] == '/') return true;
  if (s[0] == ':') s = trim(s.substr(1));
  if (s.rfind("set ", 0) == 0) s = trim(s.substr(4));
  size_t eq = s.find('=');
  if (eq == std::string::npos) { msg = "expected name=value: " + s; return false; }
  std::string name = trim(s.substr(0, eq));
  std::string value = trim(s.substr(eq + 1));
  return registry().apply(cfg, name, value, msg);
}

bool load_config_file(Config& cfg, const std::filesystem::path& path, std::string& msg) {
  std::vector<std::string> lines;
  if (!mmap_readlines(path, lines, msg)) return false;
  bool ok = true;
  for (size_t i = 0; i < lines.size(); ++i) {
    std::string err;
    if (!apply_option(cfg, lines[i], err)) {
      if (!msg.empty()) msg += "; ";
      msg += path.filename().string() + ":" + std::to_string(i + 1) + ": " + err;
      ok = false;
    }
  }
  return ok;
}

void apply_env_overrides(Config& cfg) {
  if (const char* v = std::getenv("LUMEN_COLOR")) {
    int c = 0;
    if (parse_color(v, c)) cfg.color = c;
  }
  if (const char* v = std::getenv("LUMEN_LOG")) cfg.log_file = v;
  if (const char* v = std::getenv("LUMEN_LOGLEVEL")) {
    if (is_level_name(v)) cfg.log_level = v;
  }
}

bool load_config(Config& cfg, std::string& msg) {
  bool ok = true;
  if (const char* home = std::getenv("HOME")) {
    std::error_code ec;
    auto p = std::filesystem::path(home) / LUMEN_RC_NAME;
    if (std::filesystem::exists(p, ec)) ok = load_config_file(cfg, p, msg);
  }
  apply_env_overrides(cfg);
  return ok;
}
