#include "core/config.hpp"
#include <cstdlib>

namespace trustconf::core::config {

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    if (value == nullptr) {
        return {};
    }
    return value;
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    if (value.empty()) {
        return fallback;
    }
    return value;
}

std::string log_level_name() {
    return get_env_or(kLogLevelEnv, kDefaultLogLevel);
}

} // namespace trustconf::core::config
