/**
 * trustconf Importer
 *
 * Imports variable values from untrusted line-oriented configuration files.
 * A value is accepted only from a line of the form
 *
 *     <name><separator><value>[blanks][# comment]
 *
 * where <value> matches a caller-supplied pattern. Every other line is ignored.
 */
#pragma once
#include <filesystem>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include <spdlog/spdlog.h>

namespace trustconf::conf {

inline constexpr const char* kDefaultSeparator = "=";

// Single-variable import outcome
struct ImportResult {
    bool found = false;
    std::string value;  // Only meaningful if found
};

enum class ImportStatus {
    OK,                 // File read and scanned
    FILE_UNREADABLE,    // File could not be opened
    INVALID_PATTERN,    // Bad value pattern, empty name or separator
    INCOMPLETE          // A required variable was not found
};

inline const char* status_to_string(ImportStatus status) {
    switch (status) {
        case ImportStatus::OK:              return "ok";
        case ImportStatus::FILE_UNREADABLE: return "file_unreadable";
        case ImportStatus::INVALID_PATTERN: return "invalid_pattern";
        case ImportStatus::INCOMPLETE:      return "incomplete";
        default: return "unknown";
    }
}

// Multi-variable import outcome. values is empty unless status is OK.
struct ImportManyResult {
    ImportStatus status = ImportStatus::OK;
    std::unordered_map<std::string, std::string> values;

    bool success() const { return status == ImportStatus::OK; }
};

/**
 * Validating importer.
 * Holds only the logger that receives diagnostics; each call reads and
 * scans its file independently.
 */
class Importer {
public:
    /**
     * Diagnostics go to the given logger at warn level.
     * Throws std::invalid_argument if logger is null.
     */
    explicit Importer(std::shared_ptr<spdlog::logger> logger = spdlog::default_logger());

    /**
     * Import a single variable.
     * Later definitions override earlier ones, with a redefinition warning.
     * found is false if no line matched or the file could not be opened.
     */
    ImportResult import_one(const std::filesystem::path& file,
                            const std::string& name,
                            const std::string& value_pattern,
                            const std::string& separator = kDefaultSeparator) const;

    /**
     * Import several variables sharing a separator and a value pattern.
     * Names without a valid definition are left out of the result.
     * Returns FILE_UNREADABLE if the file could not be opened.
     */
    ImportManyResult import_many(const std::filesystem::path& file,
                                 const std::vector<std::string>& names,
                                 const std::string& value_pattern,
                                 const std::string& separator = kDefaultSeparator) const;

    /**
     * Like import_many, but returns INCOMPLETE (and no values) unless every
     * name was found. Each missing name is reported.
     */
    ImportManyResult import_all_required(const std::filesystem::path& file,
                                         const std::vector<std::string>& names,
                                         const std::string& value_pattern,
                                         const std::string& separator = kDefaultSeparator) const;

    std::shared_ptr<spdlog::logger> logger() const { return logger_; }

private:
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace trustconf::conf
