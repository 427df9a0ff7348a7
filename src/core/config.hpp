#pragma once
#include <string>

namespace trustconf::core::config {

// Environment variable holding the log level name.
inline constexpr const char* kLogLevelEnv = "TRUSTCONF_LOG_LEVEL";
inline constexpr const char* kDefaultLogLevel = "info";

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback (also used when set but empty).
std::string get_env_or(const std::string& key, const std::string& fallback);

// Configured log level name, kDefaultLogLevel if unset.
std::string log_level_name();

} // namespace trustconf::core::config
