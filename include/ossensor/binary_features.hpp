#pragma once

/**
 * @file binary_features.hpp
 * @brief BinaryFeatureExtractor: strings, imports and symbols of one artifact
 */

#include "ossensor/common.hpp"
#include "ossensor/evidence.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace ossensor::binary {

struct BinaryExtractOptions
{
    std::size_t min_string_length = 6;  ///< Shortest printable run kept as a string
    std::size_t max_strings = 2000;     ///< Cap on retained strings per artifact
};

/// (build_id, component) key of an artifact
struct ArtifactLabel
{
    std::string build_id;
    std::string component;
};

/**
 * Identify the container format by magic.
 * Fewer than four bytes, or an unrecognized magic, is kUnknown.
 */
[[nodiscard]] evidence::BinaryFormat detect_format(std::span<const std::uint8_t> data);

/**
 * Printable ASCII runs (plus tab) of at least min_length characters,
 * de-duplicated in first-seen order.
 *
 * @param capped Set when more than max_count distinct strings were found
 */
[[nodiscard]] std::vector<std::string> extract_printable_strings(std::span<const std::uint8_t> data,
                                                                 std::size_t min_length,
                                                                 std::size_t max_count,
                                                                 bool& capped);

class BinaryFeatureExtractor
{
public:
    explicit BinaryFeatureExtractor(BinaryExtractOptions options = {});

    /**
     * Extract features from a file. Never fails: an unreadable file yields
     * status kUnreadable, a bad image kTruncated / kMalformed / kUnsupported,
     * each with empty feature lists and a notice.
     */
    [[nodiscard]] evidence::BinaryFeatureSet extract_file(const std::filesystem::path& path,
                                                          const ArtifactLabel& label) const;

    [[nodiscard]] evidence::BinaryFeatureSet extract_bytes(std::span<const std::uint8_t> data,
                                                           const ArtifactLabel& label) const;

private:
    BinaryExtractOptions m_options;
};

}  // namespace ossensor::binary
