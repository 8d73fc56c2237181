#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace app_log {

// Creates the "quadrant" file logger. Falls back to the spdlog default logger
// when the file sink cannot be opened. Safe to call more than once; the last
// call wins.
std::shared_ptr<spdlog::logger> init(const std::string& file_path, spdlog::level::level_enum level);

// The logger created by init(), or the spdlog default logger before that.
std::shared_ptr<spdlog::logger> logger();

// Accepts trace, debug, info, warn, error, critical, off.
bool parse_level(const std::string& text, spdlog::level::level_enum& out);

} // namespace app_log
