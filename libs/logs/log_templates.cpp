/**
 * @file log_templates.cpp
 * @brief Log line parsing and template extraction
 */

#include "ossensor/log_templates.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <map>
#include <regex>
#include <system_error>
#include <tuple>
#include <utility>

#include <spdlog/spdlog.h>

namespace ossensor::logs {

namespace {

using evidence::LogTemplate;

constexpr std::string_view kDefaultRoute = "default";

[[nodiscard]] bool is_ident_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

[[nodiscard]] bool is_hex_digit(char c)
{
    return std::isxdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_digit(char c)
{
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' || c == '\f';
}

[[nodiscard]] std::string_view trim(std::string_view text)
{
    while (!text.empty() && is_space(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_space(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

[[nodiscard]] const std::regex& iso_timestamp_regex()
{
    static const std::regex kRegex(
        R"(^\d{4}-\d{2}-\d{2}[T ]\d{2}:\d{2}:\d{2}(?:[.,]\d+)?(?:Z|[+-]\d{2}:?\d{2})?\s+)");
    return kRegex;
}

[[nodiscard]] const std::regex& syslog_timestamp_regex()
{
    static const std::regex kRegex(R"(^[A-Z][a-z]{2}\s+\d{1,2}\s+\d{2}:\d{2}:\d{2}\s+)");
    return kRegex;
}

/// "[host ]process[pid]:" as written by syslog and most daemons
[[nodiscard]] const std::regex& process_prefix_regex()
{
    static const std::regex kRegex(R"(^(?:[\w.\-]+\s+)?[\w.\-/]+\[\d+\]:\s*)");
    return kRegex;
}

[[nodiscard]] const std::regex& route_tag_regex()
{
    static const std::regex kRegex(R"(\[([\w.\-]+):([\w.\-]+)\])");
    return kRegex;
}

/// Drop the match of re at the start of text, if any
[[nodiscard]] std::string_view strip_prefix(std::string_view text, const std::regex& re)
{
    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(text.begin(), text.end(), match, re)) {
        text.remove_prefix(static_cast<std::size_t>(match.length(0)));
    }
    return text;
}

/// Length of an 8-4-4-4-12 UUID starting at pos, or 0
[[nodiscard]] std::size_t uuid_length(std::string_view text, std::size_t pos)
{
    constexpr std::size_t kGroups[] = {8, 4, 4, 4, 12};
    std::size_t i = pos;
    for (std::size_t g = 0; g < std::size(kGroups); ++g) {
        if (g > 0) {
            if (i >= text.size() || text[i] != '-') {
                return 0;
            }
            ++i;
        }
        for (std::size_t k = 0; k < kGroups[g]; ++k, ++i) {
            if (i >= text.size() || !is_hex_digit(text[i])) {
                return 0;
            }
        }
    }
    if (i < text.size() && is_ident_char(text[i])) {
        return 0;
    }
    return i - pos;
}

/// Length of a "0x..." literal starting at pos, or 0
[[nodiscard]] std::size_t hex_length(std::string_view text, std::size_t pos)
{
    if (pos + 2 >= text.size() || text[pos] != '0' || (text[pos + 1] != 'x' && text[pos + 1] != 'X')) {
        return 0;
    }
    std::size_t i = pos + 2;
    while (i < text.size() && is_hex_digit(text[i])) {
        ++i;
    }
    if (i == pos + 2 || (i < text.size() && is_ident_char(text[i]))) {
        return 0;
    }
    return i - pos;
}

/// Length of a decimal number (optionally with a fraction) starting at pos,
/// or 0 when it runs into an identifier
[[nodiscard]] std::size_t number_length(std::string_view text, std::size_t pos)
{
    std::size_t i = pos;
    while (i < text.size() && is_digit(text[i])) {
        ++i;
    }
    if (i == pos) {
        return 0;
    }
    if (i + 1 < text.size() && text[i] == '.' && is_digit(text[i + 1])) {
        ++i;
        while (i < text.size() && is_digit(text[i])) {
            ++i;
        }
    }
    if (i < text.size() && is_ident_char(text[i])) {
        return 0;
    }
    return i - pos;
}

/**
 * Accumulates templates across one or more streams, keyed by
 * (subsystem, category, format) in first-seen order.
 */
class TemplateBuilder
{
public:
    explicit TemplateBuilder(const LogTemplateOptions& options)
        : m_options(options)
    {}

    void add_stream(std::istream& in)
    {
        std::string line;
        while (std::getline(in, line)) {
            add_line(line);
        }
    }

    void add_line(std::string_view raw)
    {
        if (raw.size() > m_options.max_line_length) {
            raw = raw.substr(0, m_options.max_line_length);
        }
        const std::string line = common::sanitize_utf8(trim(raw));
        if (line.empty()) {
            return;
        }
        ParsedLogLine parsed = parse_log_line(line);
        std::string format = make_format_string(parsed.message);
        if (format.empty()) {
            return;
        }

        auto key = std::make_tuple(parsed.subsystem, parsed.category, format);
        auto [it, inserted] = m_index.try_emplace(std::move(key), m_templates.size());
        if (inserted) {
            LogTemplate tpl;
            tpl.template_id = evidence::make_template_id(parsed.subsystem, parsed.category, format);
            tpl.subsystem = std::move(parsed.subsystem);
            tpl.category = std::move(parsed.category);
            tpl.format_string = std::move(format);
            m_templates.push_back(std::move(tpl));
        }
        LogTemplate& tpl = m_templates[it->second];
        ++tpl.occurrences;
        if (tpl.samples.size() < m_options.max_samples) {
            tpl.samples.push_back(std::move(parsed.message));
        }
    }

    [[nodiscard]] std::vector<LogTemplate> finish() && { return std::move(m_templates); }

private:
    const LogTemplateOptions& m_options;
    std::map<std::tuple<std::string, std::string, std::string>, std::size_t> m_index;
    std::vector<LogTemplate> m_templates;
};

[[nodiscard]] ossensor::Result<std::vector<std::filesystem::path>>
collect_log_files(const std::filesystem::path& root)
{
    std::vector<std::filesystem::path> files;
    std::error_code ec;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(
            Error::make("IOError", "Failed to walk log directory " + root.string() + ": " + ec.message()));
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to walk log directory " + root.string() + ": " + ec.message()));
        }
        const auto& entry = *it;
        if (entry.path().filename().string().starts_with('.')) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (entry.is_regular_file(ec)) {
            files.push_back(entry.path());
        }
    }
    std::ranges::sort(files, [&root](const auto& a, const auto& b) {
        return common::make_relative(a.generic_string(), root.generic_string())
               < common::make_relative(b.generic_string(), root.generic_string());
    });
    return files;
}

}  // namespace

ParsedLogLine parse_log_line(std::string_view line)
{
    std::string_view rest = trim(line);
    rest = strip_prefix(rest, iso_timestamp_regex());
    rest = strip_prefix(rest, syslog_timestamp_regex());
    rest = strip_prefix(rest, process_prefix_regex());

    ParsedLogLine parsed{.subsystem = std::string(kDefaultRoute),
                         .category = std::string(kDefaultRoute),
                         .message = {}};

    std::match_results<std::string_view::const_iterator> match;
    if (std::regex_search(rest.begin(), rest.end(), match, route_tag_regex())) {
        parsed.subsystem = match[1].str();
        parsed.category = match[2].str();
        const auto begin = static_cast<std::size_t>(match.position(0));
        const auto length = static_cast<std::size_t>(match.length(0));
        std::string message(rest.substr(0, begin));
        message += rest.substr(begin + length);
        parsed.message = std::string(trim(message));
    } else {
        parsed.message = std::string(trim(rest));
    }
    return parsed;
}

std::string make_format_string(std::string_view message)
{
    std::string out;
    out.reserve(message.size());
    bool pending_space = false;
    const auto emit = [&out, &pending_space](std::string_view token) {
        if (pending_space && !out.empty()) {
            out += ' ';
        }
        pending_space = false;
        out += token;
    };

    std::size_t i = 0;
    while (i < message.size()) {
        const char c = message[i];
        if (is_space(c)) {
            pending_space = true;
            ++i;
            continue;
        }

        const bool at_boundary = i == 0 || !is_ident_char(message[i - 1]);
        // A quote inside a word ("can't") is an apostrophe, not a string
        if (at_boundary && (c == '"' || c == '\'')) {
            const auto close = message.find(c, i + 1);
            if (close != std::string_view::npos) {
                emit(kStringPlaceholder);
                i = close + 1;
                continue;
            }
        }

        if (at_boundary) {
            if (const auto len = uuid_length(message, i); len > 0) {
                emit(kUuidPlaceholder);
                i += len;
                continue;
            }
            if (const auto len = hex_length(message, i); len > 0) {
                emit(kHexPlaceholder);
                i += len;
                continue;
            }
            if (const auto len = number_length(message, i); len > 0) {
                emit(kNumberPlaceholder);
                i += len;
                continue;
            }
        }

        // Copy the run up to the next character that may start a token
        std::size_t end = i + 1;
        if (is_ident_char(c)) {
            while (end < message.size() && is_ident_char(message[end])) {
                ++end;
            }
        }
        emit(message.substr(i, end - i));
        i = end;
    }
    return out;
}

LogTemplateExtractor::LogTemplateExtractor(LogTemplateOptions options)
    : m_options(options)
{}

std::vector<LogTemplate> LogTemplateExtractor::extract(std::istream& in) const
{
    TemplateBuilder builder(m_options);
    builder.add_stream(in);
    return std::move(builder).finish();
}

ossensor::Result<std::vector<LogTemplate>>
LogTemplateExtractor::extract_path(const std::filesystem::path& path) const
{
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_directory(path, ec)) {
        auto collected = collect_log_files(path);
        if (!collected) {
            return std::unexpected(collected.error());
        }
        files = std::move(*collected);
    } else {
        files.push_back(path);
    }

    TemplateBuilder builder(m_options);
    for (const auto& file : files) {
        std::ifstream in(file, std::ios::binary);
        if (!in) {
            return std::unexpected(Error::make("IOError", "Failed to open log file: " + file.string()));
        }
        spdlog::debug("log templates: reading {}", file.string());
        builder.add_stream(in);
    }
    auto templates = std::move(builder).finish();
    spdlog::debug("log templates: {} templates from {} files", templates.size(), files.size());
    return templates;
}

}  // namespace ossensor::logs
