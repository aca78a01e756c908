#pragma once
/*
 * Config
 *
 * Purpose: compile-time defaults (LUMEN_* macros) and the run-time Config
 * loaded from ~/.lumenrc plus LUMEN_* environment overrides.
 * Usage: load_config(cfg, msg); problems land in msg, never fatal.
 */
#include <string>
#include <filesystem>

#ifndef LUMEN_OUTPUT_BUFFER_SIZE
#define LUMEN_OUTPUT_BUFFER_SIZE (128 * 1024)
#endif

#ifndef LUMEN_ESCAPE_TIMEOUT_MS
#define LUMEN_ESCAPE_TIMEOUT_MS 50
#endif

#ifndef LUMEN_DEFAULT_FPS
#define LUMEN_DEFAULT_FPS 120
#endif

#define LUMEN_RC_NAME ".lumenrc"

#define LUMEN_COLOR_AUTO      0
#define LUMEN_COLOR_256       1
#define LUMEN_COLOR_TRUECOLOR 2

struct Config {
  int color = LUMEN_COLOR_AUTO;
  int fps = LUMEN_DEFAULT_FPS;
  int escape_timeout_ms = LUMEN_ESCAPE_TIMEOUT_MS;
  std::string log_file;
  std::string log_level = "info";
};

// Applies one "name=value" option. Returns false with msg for unknown names or bad values.
bool apply_option(Config& cfg, const std::string& line, std::string& msg);
bool load_config_file(Config& cfg, const std::filesystem::path& path, std::string& msg);
void apply_env_overrides(Config& cfg);
// $HOME/.lumenrc (if present) then environment.
bool load_config(Config& cfg, std::string& msg);
