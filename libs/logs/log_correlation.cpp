/**
 * @file log_correlation.cpp
 * @brief LogBinaryCorrelator implementation
 */

#include "ossensor/log_correlation.hpp"

#include "ossensor/log_templates.hpp"

#include <algorithm>
#include <array>
#include <utility>

#include <spdlog/spdlog.h>

namespace ossensor::logs {

namespace {

constexpr std::array<std::string_view, 4> kPlaceholders = {
    kStringPlaceholder,
    kUuidPlaceholder,
    kHexPlaceholder,
    kNumberPlaceholder,
};

[[nodiscard]] std::string_view trim_spaces(std::string_view text)
{
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    return text;
}

/// Position and length of the earliest placeholder at or after pos
[[nodiscard]] std::pair<std::size_t, std::size_t> next_placeholder(std::string_view text, std::size_t pos)
{
    std::size_t best = std::string_view::npos;
    std::size_t length = 0;
    for (const auto placeholder : kPlaceholders) {
        const auto found = text.find(placeholder, pos);
        if (found < best) {
            best = found;
            length = placeholder.size();
        }
    }
    return {best, length};
}

}  // namespace

std::vector<std::string> literal_fragments(std::string_view format_string, std::size_t min_length)
{
    std::vector<std::string> fragments;
    const auto keep = [&fragments, min_length](std::string_view piece) {
        piece = trim_spaces(piece);
        if (!piece.empty() && piece.size() >= min_length) {
            fragments.emplace_back(piece);
        }
    };

    std::size_t pos = 0;
    while (pos <= format_string.size()) {
        const auto [found, length] = next_placeholder(format_string, pos);
        if (found == std::string_view::npos) {
            keep(format_string.substr(pos));
            break;
        }
        keep(format_string.substr(pos, found - pos));
        pos = found + length;
    }
    return fragments;
}

LogBinaryCorrelator::LogBinaryCorrelator(CorrelationOptions options)
    : m_options(options)
{}

std::vector<evidence::LogToBinaryMatch>
LogBinaryCorrelator::correlate(const std::vector<evidence::LogTemplate>& templates,
                               const evidence::BinaryFeatureSet& binary) const
{
    std::vector<evidence::LogToBinaryMatch> matches;
    if (binary.strings.empty()) {
        return matches;
    }

    const std::size_t min_length = m_options.min_fragment_length;
    for (const auto& tpl : templates) {
        const auto fragments = literal_fragments(tpl.format_string, min_length);
        if (fragments.empty()) {
            continue;
        }
        for (const auto& str : binary.strings) {
            // Only whole fragments count; a symbol name inside a message is not a match
            const bool matched = std::ranges::any_of(fragments, [&str](const std::string& fragment) {
                return str.value.find(fragment) != std::string::npos;
            });
            if (!matched) {
                continue;
            }
            matches.push_back(evidence::LogToBinaryMatch{
                .match_id = evidence::make_match_id(tpl.template_id, str.string_id),
                .template_id = tpl.template_id,
                .string_id = str.string_id,
                .artifact_id = binary.artifact_id,
                .matched_string = str.value,
            });
        }
    }
    spdlog::debug("log correlation: {} matches against {}", matches.size(), binary.artifact_id);
    return matches;
}

}  // namespace ossensor::logs
