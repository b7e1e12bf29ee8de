#pragma once

/**
 * @file source_diff.hpp
 * @brief SourceDiffAnalyzer: line-level diff of two source trees and
 *        security-relevant feature derivation from the resulting hunks
 */

#include "ossensor/common.hpp"
#include "ossensor/evidence.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ossensor::source {

struct SourceDiffOptions
{
    std::uint32_t context_lines = 3;      ///< Unchanged lines kept around a change
    std::uint32_t guard_window = 3;       ///< Lines a guard may precede its guarded call by
    std::uint64_t max_lcs_cells = 16'000'000;  ///< LCS table budget per file
    std::uint32_t max_line_length = 4096;      ///< Longer lines are diffed but never classified
};

/// One file of an in-memory tree; path is relative to the tree root
struct SourceText
{
    std::string path;
    std::string content;
    bool readable = true;  ///< false when the file could not be opened
};

struct SourceDiffResult
{
    std::vector<evidence::DiffHunk> hunks;          ///< File path order, then position order
    std::vector<evidence::SourceFeature> features;  ///< Hunk order
    std::vector<evidence::SkipNotice> skips;        ///< File path order
};

class SourceDiffAnalyzer
{
public:
    explicit SourceDiffAnalyzer(SourceDiffOptions options = {});

    /**
     * Diff two directory trees. An absent root stands for an empty tree.
     * Hidden entries (leading '.') are ignored.
     *
     * @return IOError only when a given root is not a readable directory;
     *         undecodable files become skip notices
     */
    [[nodiscard]] ossensor::Result<SourceDiffResult>
    analyze_trees(const std::optional<std::filesystem::path>& from_root,
                  const std::optional<std::filesystem::path>& to_root) const;

    /**
     * Diff two in-memory trees. Paths are normalized before pairing.
     */
    [[nodiscard]] SourceDiffResult analyze_texts(const std::vector<SourceText>& from_files,
                                                 const std::vector<SourceText>& to_files) const;

    /**
     * Derive features from a single hunk. Only changed lines trigger a
     * feature; context lines are consulted for guard adjacency.
     */
    [[nodiscard]] std::vector<evidence::SourceFeature>
    derive_features(const evidence::DiffHunk& hunk) const;

    [[nodiscard]] const SourceDiffOptions& options() const { return m_options; }

private:
    SourceDiffOptions m_options;
};

}  // namespace ossensor::source
