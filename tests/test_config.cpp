#include "config.hpp"
#include "file_reader.hpp"
#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

static std::filesystem::path make_temp_dir() {
  std::string tmpl = (std::filesystem::temp_directory_path() / "lumen_test_XXXXXX").string();
  char* dir = ::mkdtemp(tmpl.data());
  assert(dir != nullptr);
  return std::filesystem::path(dir);
}

static void write_file(const std::filesystem::path& p, const std::string& body) {
  std::ofstream out(p, std::ios::binary);
  out << body;
}

static void test_apply_option() {
  Config cfg;
  std::string msg;
  assert(apply_option(cfg, "set color=truecolor", msg));
  assert(cfg.color == LUMEN_COLOR_TRUECOLOR);
  assert(apply_option(cfg, ":set fps=60", msg));
  assert(cfg.fps == 60);
  assert(apply_option(cfg, "  escape_timeout = 25 ", msg));
  assert(cfg.escape_timeout_ms == 25);
  assert(apply_option(cfg, "log=/tmp/lumen.log", msg));
  assert(cfg.log_file == "/tmp/lumen.log");
  assert(apply_option(cfg, "loglevel=debug", msg));
  assert(cfg.log_level == "debug");
  assert(apply_option(cfg, "fps=0", msg));
  assert(cfg.fps == 0);

  assert(apply_option(cfg, "# comment", msg));
  assert(apply_option(cfg, "\" vim style comment", msg));
  assert(apply_option(cfg, "// other comment", msg));
  assert(apply_option(cfg, "   ", msg));

  assert(!apply_option(cfg, "color=16", msg));
  assert(msg.find("color") != std::string::npos);
  assert(cfg.color == LUMEN_COLOR_TRUECOLOR);
  assert(!apply_option(cfg, "fps=-1", msg));
  assert(!apply_option(cfg, "fps=fast", msg));
  assert(cfg.fps == 0);
  assert(!apply_option(cfg, "escape_timeout=0", msg));
  assert(!apply_option(cfg, "loglevel=loud", msg));
  assert(!apply_option(cfg, "nosuch=1", msg));
  assert(msg.find("unknown option") != std::string::npos);
  assert(!apply_option(cfg, "set fps", msg));
}

static void test_readlines() {
  auto dir = make_temp_dir();
  auto p = dir / "lines.txt";
  write_file(p, "one\r\ntwo\n\nthree");
  std::vector<std::string> lines;
  std::string msg;
  assert(mmap_readlines(p, lines, msg));
  assert(lines.size() == 4);
  assert(lines[0] == "one");
  assert(lines[1] == "two");
  assert(lines[2].empty());
  assert(lines[3] == "three");

  write_file(p, "");
  assert(mmap_readlines(p, lines, msg));
  assert(lines.empty());
  assert(!mmap_readlines(dir / "missing", lines, msg));
  assert(msg.find("can not open") == 0);
  std::filesystem::remove_all(dir);
}

static void test_load_file() {
  auto dir = make_temp_dir();
  auto p = dir / ".lumenrc";
  write_file(p, "# lumen settings\nset color=256\nfps=30\nbogus=1\nloglevel=warn\n");
  Config cfg;
  std::string msg;
  assert(!load_config_file(cfg, p, msg));
  assert(msg.find(".lumenrc:4") != std::string::npos);
  assert(cfg.color == LUMEN_COLOR_256);
  assert(cfg.fps == 30);
  assert(cfg.log_level == "warn");
  std::filesystem::remove_all(dir);
}

static void test_env_and_home() {
  auto dir = make_temp_dir();
  write_file(dir / LUMEN_RC_NAME, "color=256\nlog=/tmp/from_rc.log\n");
  ::setenv("HOME", dir.c_str(), 1);
  ::setenv("LUMEN_COLOR", "truecolor", 1);
  ::unsetenv("LUMEN_LOG");
  ::setenv("LUMEN_LOGLEVEL", "nonsense", 1);
  Config cfg;
  std::string msg;
  assert(load_config(cfg, msg));
  assert(cfg.color == LUMEN_COLOR_TRUECOLOR);
  assert(cfg.log_file == "/tmp/from_rc.log");
  assert(cfg.log_level == "info");

  ::setenv("LUMEN_LOG", "/tmp/from_env.log", 1);
  ::setenv("LUMEN_LOGLEVEL", "trace", 1);
  apply_env_overrides(cfg);
  assert(cfg.log_file == "/tmp/from_env.log");
  assert(cfg.log_level == "trace");

  // No rc file is not an error.
  std::filesystem::remove(dir / LUMEN_RC_NAME);
  Config plain;
  ::unsetenv("LUMEN_COLOR");
  assert(load_config(plain, msg));
  assert(plain.color == LUMEN_COLOR_AUTO);
  assert(plain.fps == LUMEN_DEFAULT_FPS);
  assert(plain.escape_timeout_ms == LUMEN_ESCAPE_TIMEOUT_MS);
  std::filesystem::remove_all(dir);
}

int main() {
  test_apply_option();
  test_readlines();
  test_load_file();
  test_env_and_home();
  return 0;
}
