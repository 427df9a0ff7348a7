#pragma once
#include <memory>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace trustconf::core {

// Install the "trustconf" console logger as spdlog's default logger.
// Level is read from TRUSTCONF_LOG_LEVEL (default: info).
void init_logger();

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Build a named logger over the given sinks. Not registered globally.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks);

// Map a level name to a level; unknown names yield fallback.
spdlog::level::level_enum parse_log_level(const std::string& text,
                                          spdlog::level::level_enum fallback);

} // namespace trustconf::core
