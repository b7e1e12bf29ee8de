#pragma once

/**
 * @file log_templates.hpp
 * @brief LogTemplateExtractor: reduce raw log lines to message templates
 */

#include "ossensor/common.hpp"
#include "ossensor/evidence.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace ossensor::logs {

struct LogTemplateOptions
{
    std::size_t max_samples = 3;         ///< Raw messages kept per template
    std::size_t max_line_length = 4096;  ///< Longer lines are cut before templating
};

/// Placeholder tokens substituted for variable content
constexpr std::string_view kStringPlaceholder = "<str>";
constexpr std::string_view kUuidPlaceholder = "<uuid>";
constexpr std::string_view kHexPlaceholder = "<hex>";
constexpr std::string_view kNumberPlaceholder = "<num>";

/// One raw line split into its routing tag and message body
struct ParsedLogLine
{
    std::string subsystem;
    std::string category;
    std::string message;  ///< Timestamp / process prefix and tag removed
};

/**
 * Strip leading ISO-8601 or syslog timestamps and a "process[pid]:" prefix,
 * then take subsystem/category from the first "[subsystem:category]" tag.
 * Both default to "default".
 */
[[nodiscard]] ParsedLogLine parse_log_line(std::string_view line);

/**
 * Replace quoted strings, UUIDs, hex and decimal numbers with placeholders
 * and collapse whitespace.
 */
[[nodiscard]] std::string make_format_string(std::string_view message);

class LogTemplateExtractor
{
public:
    explicit LogTemplateExtractor(LogTemplateOptions options = {});

    /// Templates in first-seen order, deduplicated by (subsystem, category, format)
    [[nodiscard]] std::vector<evidence::LogTemplate> extract(std::istream& in) const;

    /**
     * Extract from a file, or from every non-hidden file under a directory
     * in sorted relative-path order (as one stream).
     * @return IOError when the path cannot be read
     */
    [[nodiscard]] ossensor::Result<std::vector<evidence::LogTemplate>>
    extract_path(const std::filesystem::path& path) const;

private:
    LogTemplateOptions m_options;
};

}  // namespace ossensor::logs
