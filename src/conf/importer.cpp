/**
 * trustconf Importer Implementation
 */
#include "conf/importer.hpp"
#include "conf/line_matcher.hpp"
#include <fstream>
#include <optional>
#include <stdexcept>
#include <unordered_set>

namespace trustconf::conf {

namespace {

// Whole file as lines, trailing '\r' removed. Lines over kMaxLineLength are
// dropped with a warning. nullopt if the file cannot be opened or read.
std::optional<std::vector<std::string>> read_lines(spdlog::logger& logger,
                                                   const std::filesystem::path& file) {
    std::error_code ec;
    if (std::filesystem::is_directory(file, ec)) {
        return std::nullopt;
    }

    std::ifstream in(file);
    if (!in.is_open()) {
        return std::nullopt;
    }

    std::vector<std::string> lines;
    std::string line;
    size_t line_number = 0;
    while (std::getline(in, line)) {
        ++line_number;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.size() > kMaxLineLength) {
            logger.warn("line {} of {} exceeds {} bytes, ignored",
                        line_number, file.string(), kMaxLineLength);
            continue;
        }
        lines.push_back(std::move(line));
    }

    if (in.bad()) {
        return std::nullopt;
    }
    return lines;
}

// Drop repeated names, keeping first occurrence order.
std::vector<std::string> unique_names(const std::vector<std::string>& names) {
    std::vector<std::string> unique;
    std::unordered_set<std::string> seen;
    for (const auto& name : names) {
        if (seen.insert(name).second) {
            unique.push_back(name);
        }
    }
    return unique;
}

// One matcher per name; nullopt (and a warning) if any rule cannot be built.
std::optional<std::vector<LineMatcher>> build_matchers(spdlog::logger& logger,
                                                       const std::vector<std::string>& names,
                                                       const std::string& value_pattern,
                                                       const std::string& separator) {
    std::vector<LineMatcher> matchers;
    matchers.reserve(names.size());

    for (const auto& name : names) {
        try {
            matchers.emplace_back(name, separator, value_pattern);
        } catch (const std::regex_error& e) {
            logger.warn("invalid pattern for {}: {}", name, e.what());
            return std::nullopt;
        } catch (const std::invalid_argument& e) {
            logger.warn("invalid pattern for {}: {}", name, e.what());
            return std::nullopt;
        }
    }
    return matchers;
}

} // namespace

Importer::Importer(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger)) {
    if (!logger_) {
        throw std::invalid_argument("Importer requires a logger");
    }
}

ImportResult Importer::import_one(const std::filesystem::path& file,
                                  const std::string& name,
                                  const std::string& value_pattern,
                                  const std::string& separator) const {
    ImportResult result;

    auto matchers = build_matchers(*logger_, {name}, value_pattern, separator);
    if (!matchers) {
        return result;
    }
    const LineMatcher& matcher = matchers->front();

    auto lines = read_lines(*logger_, file);
    if (!lines) {
        logger_->warn("could not open {} for reading", file.string());
        return result;
    }
    logger_->debug("Read {} lines from {}", lines->size(), file.string());

    for (const auto& line : *lines) {
        auto value = matcher.match(line);
        if (!value) {
            continue;
        }

        if (result.found) {
            logger_->warn("redefinition of {}, overriding {}", name, result.value);
        }
        result.found = true;
        result.value = std::move(*value);
    }

    if (result.found) {
        logger_->debug("Imported {} from {}", name, file.string());
    }
    return result;
}

ImportManyResult Importer::import_many(const std::filesystem::path& file,
                                       const std::vector<std::string>& names,
                                       const std::string& value_pattern,
                                       const std::string& separator) const {
    ImportManyResult result;

    auto matchers = build_matchers(*logger_, unique_names(names), value_pattern, separator);
    if (!matchers) {
        result.status = ImportStatus::INVALID_PATTERN;
        return result;
    }

    auto lines = read_lines(*logger_, file);
    if (!lines) {
        logger_->warn("could not open {} for reading", file.string());
        result.status = ImportStatus::FILE_UNREADABLE;
        return result;
    }
    logger_->debug("Read {} lines from {}", lines->size(), file.string());

    for (const auto& line : *lines) {
        for (const auto& matcher : *matchers) {
            auto value = matcher.match(line);
            if (!value) {
                continue;
            }

            auto it = result.values.find(matcher.name());
            if (it != result.values.end()) {
                logger_->warn("redefinition of {}, overriding {}", matcher.name(), it->second);
                it->second = std::move(*value);
            } else {
                result.values.emplace(matcher.name(), std::move(*value));
            }
        }
    }

    logger_->debug("Imported {} of {} variables from {}",
                   result.values.size(), matchers->size(), file.string());
    return result;
}

ImportManyResult Importer::import_all_required(const std::filesystem::path& file,
                                               const std::vector<std::string>& names,
                                               const std::string& value_pattern,
                                               const std::string& separator) const {
    auto result = import_many(file, names, value_pattern, separator);
    if (!result.success()) {
        return result;
    }

    bool complete = true;
    for (const auto& name : unique_names(names)) {
        if (result.values.find(name) == result.values.end()) {
            logger_->warn("failed to import {} from {}", name, file.string());
            complete = false;
        }
    }

    if (!complete) {
        result.status = ImportStatus::INCOMPLETE;
        result.values.clear();
    }
    return result;
}

} // namespace trustconf::conf
