#include "conf/line_matcher.hpp"
#include <cctype>
#include <stdexcept>

namespace trustconf::conf {

LineMatcher::LineMatcher(const std::string& name, const std::string& separator,
                         const std::string& value_pattern)
    : name_(name)
    , prefix_(name + separator) {
    if (name.empty()) {
        throw std::invalid_argument("empty variable name");
    }
    if (separator.empty()) {
        throw std::invalid_argument("empty separator");
    }
    re_ = std::regex(value_pattern, std::regex::ECMAScript);
}

std::optional<std::string> LineMatcher::match(const std::string& line) const {
    if (line.size() > kMaxLineLength) {
        return std::nullopt;
    }
    if (line.compare(0, prefix_.size(), prefix_) != 0) {
        return std::nullopt;
    }

    const std::string rest = line.substr(prefix_.size());

    if (auto value = match_value(rest, rest.size())) {
        return value;
    }

    // Comment start candidates, rightmost first
    for (std::size_t pos = rest.size(); pos > 0;) {
        pos = rest.rfind('#', pos - 1);
        if (pos == std::string::npos) {
            break;
        }
        if (auto value = match_value(rest, pos)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> LineMatcher::match_value(const std::string& rest,
                                                    std::size_t end) const {
    std::string candidate = rest.substr(0, end);
    if (std::regex_match(candidate, re_)) {
        return candidate;
    }

    std::size_t trimmed = candidate.size();
    while (trimmed > 0 && std::isspace(static_cast<unsigned char>(candidate[trimmed - 1]))) {
        --trimmed;
    }
    if (trimmed == candidate.size()) {
        return std::nullopt;
    }

    candidate.resize(trimmed);
    if (std::regex_match(candidate, re_)) {
        return candidate;
    }
    return std::nullopt;
}

} // namespace trustconf::conf
