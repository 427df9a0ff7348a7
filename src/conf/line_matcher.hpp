#pragma once
#include <cstddef>
#include <optional>
#include <regex>
#include <string>

namespace trustconf::conf {

// Longest line considered for matching; longer lines never match.
inline constexpr std::size_t kMaxLineLength = 4096;

// Full-line rule for one variable: <name><separator><value>[blanks][#comment]
// name and separator are compared literally; only the value goes through the
// regex, which must match it entirely (backreferences count from \1 as usual).
class LineMatcher {
public:
    // Throws std::invalid_argument on an empty name or separator,
    // std::regex_error on an invalid value pattern.
    LineMatcher(const std::string& name, const std::string& separator,
                const std::string& value_pattern);

    // Captured value if the whole line matches.
    // Value ends are tried longest first: end of line, then before each '#'
    // from the right; at each end the text is tried with, then without,
    // its trailing blanks.
    std::optional<std::string> match(const std::string& line) const;

    const std::string& name() const { return name_; }

private:
    std::optional<std::string> match_value(const std::string& rest, std::size_t end) const;

    std::string name_;
    std::string prefix_;
    std::regex re_;
};

} // namespace trustconf::conf
