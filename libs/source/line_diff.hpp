#pragma once

/**
 * @file line_diff.hpp
 * @brief LCS line diff and unified-diff hunk grouping
 */

#include "ossensor/evidence.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ossensor::source {

enum class EditOp { kEqual, kDelete, kInsert };

struct Edit
{
    EditOp op;
    std::size_t old_index;  ///< Valid for kEqual and kDelete
    std::size_t new_index;  ///< Valid for kEqual and kInsert
};

/**
 * Split text into lines on '\n', dropping a trailing '\r' from each line.
 * A final newline does not produce an empty last line.
 */
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);

/**
 * Longest-common-subsequence edit script from old_lines to new_lines.
 * Within a changed region deletions are emitted before insertions.
 *
 * @return std::nullopt when the LCS table would exceed max_cells
 */
[[nodiscard]] std::optional<std::vector<Edit>> diff_lines(const std::vector<std::string>& old_lines,
                                                          const std::vector<std::string>& new_lines,
                                                          std::uint64_t max_cells);

/**
 * Group an edit script into hunks carrying up to context_lines of context.
 * Changes separated by at most 2 * context_lines unchanged lines share a hunk.
 * Hunk ids are assigned.
 */
[[nodiscard]] std::vector<evidence::DiffHunk> build_hunks(const std::string& file_path,
                                                          const std::vector<std::string>& old_lines,
                                                          const std::vector<std::string>& new_lines,
                                                          const std::vector<Edit>& edits,
                                                          std::uint32_t context_lines);

}  // namespace ossensor::source
