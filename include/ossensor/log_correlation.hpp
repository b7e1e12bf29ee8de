#pragma once

/**
 * @file log_correlation.hpp
 * @brief LogBinaryCorrelator: literal log fragments found in a binary's strings
 */

#include "ossensor/evidence.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ossensor::logs {

struct CorrelationOptions
{
    std::size_t min_fragment_length = 8;  ///< Shorter literal fragments are ignored
};

/**
 * Literal pieces of a format string between placeholders, trimmed, keeping
 * only those at least min_length long.
 */
[[nodiscard]] std::vector<std::string> literal_fragments(std::string_view format_string,
                                                         std::size_t min_length);

/**
 * Pure substring-membership correlation. No fuzzy matching.
 */
class LogBinaryCorrelator
{
public:
    explicit LogBinaryCorrelator(CorrelationOptions options = {});

    /**
     * A binary string matches a template when it contains one of the
     * template's fragments, or when it is at least min_fragment_length long
     * and occurs inside a fragment.
     *
     * @return One match per (template, string), template order then string order
     */
    [[nodiscard]] std::vector<evidence::LogToBinaryMatch>
    correlate(const std::vector<evidence::LogTemplate>& templates,
              const evidence::BinaryFeatureSet& binary) const;

private:
    CorrelationOptions m_options;
};

}  // namespace ossensor::logs
