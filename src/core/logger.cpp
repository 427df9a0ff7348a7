#include "core/logger.hpp"
#include "core/config.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>

namespace trustconf::core {

namespace {
constexpr const char* kLoggerName = "trustconf";
constexpr const char* kLogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
} // namespace

void init_logger() {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
        logger->set_pattern(kLogPattern);
    }

    logger->set_level(parse_log_level(config::log_level_name(), spdlog::level::info));
    spdlog::set_default_logger(logger);
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

std::shared_ptr<spdlog::logger> make_logger(const std::string& name,
                                            std::vector<spdlog::sink_ptr> sinks) {
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_pattern(kLogPattern);
    return logger;
}

spdlog::level::level_enum parse_log_level(const std::string& text,
                                          spdlog::level::level_enum fallback) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return fallback;
}

} // namespace trustconf::core
