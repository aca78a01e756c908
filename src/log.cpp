#include "log.hpp"
#include <memory>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

bool init_logging(const Config& cfg, std::string& msg) {
  std::shared_ptr<spdlog::logger> logger;
  bool ok = true;
  if (!cfg.log_file.empty()) {
    try {
      auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(cfg.log_file, false);
      logger = std::make_shared<spdlog::logger>("lumen", sink);
    } catch (const spdlog::spdlog_ex& e) {
      msg = std::string("can not open log file: ") + e.what();
      ok = false;
    }
  }
  if (!logger) logger = std::make_shared<spdlog::logger>("lumen", std::make_shared<spdlog::sinks::null_sink_mt>());
  logger->set_level(spdlog::level::from_str(cfg.log_level));
  logger->set_pattern("[%H:%M:%S.%e] [%l] %v");
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(logger);
  return ok;
}
