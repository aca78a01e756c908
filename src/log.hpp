#pragma once
/*
 * Logging
 *
 * Purpose: set up spdlog's default logger from Config. The screen belongs to
 * the terminal while rendering, so output goes to a file or nowhere.
 */
#include <string>
#include "config.hpp"

// Returns false with msg if the log file can not be opened; logging is then discarded.
bool init_logging(const Config& cfg, std::string& msg);
