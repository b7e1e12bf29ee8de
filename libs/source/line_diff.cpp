/**
 * @file line_diff.cpp
 * @brief LCS line diff and hunk grouping
 */

#include "line_diff.hpp"

#include <algorithm>

namespace ossensor::source {

std::vector<std::string> split_lines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (line.ends_with('\r')) {
            line.remove_suffix(1);
        }
        lines.emplace_back(line);
        start = end + 1;
    }
    return lines;
}

std::optional<std::vector<Edit>> diff_lines(const std::vector<std::string>& old_lines,
                                            const std::vector<std::string>& new_lines,
                                            std::uint64_t max_cells)
{
    // Common prefix and suffix never need the table
    std::size_t prefix = 0;
    while (prefix < old_lines.size() && prefix < new_lines.size()
           && old_lines[prefix] == new_lines[prefix]) {
        ++prefix;
    }
    std::size_t suffix = 0;
    while (suffix < old_lines.size() - prefix && suffix < new_lines.size() - prefix
           && old_lines[old_lines.size() - 1 - suffix] == new_lines[new_lines.size() - 1 - suffix]) {
        ++suffix;
    }

    const std::size_t n = old_lines.size() - prefix - suffix;
    const std::size_t m = new_lines.size() - prefix - suffix;
    const auto cells = static_cast<std::uint64_t>(n + 1) * static_cast<std::uint64_t>(m + 1);
    if (cells > max_cells) {
        return std::nullopt;
    }

    // lcs[i * (m + 1) + j] = LCS length of old[prefix + i ..] and new[prefix + j ..]
    std::vector<std::uint32_t> lcs(static_cast<std::size_t>(cells), 0U);
    const auto at = [m](std::size_t i, std::size_t j) { return i * (m + 1) + j; };
    for (std::size_t i = n; i-- > 0;) {
        for (std::size_t j = m; j-- > 0;) {
            if (old_lines[prefix + i] == new_lines[prefix + j]) {
                lcs[at(i, j)] = lcs[at(i + 1, j + 1)] + 1;
            } else {
                lcs[at(i, j)] = std::max(lcs[at(i + 1, j)], lcs[at(i, j + 1)]);
            }
        }
    }

    std::vector<Edit> edits;
    edits.reserve(prefix + suffix + n + m);
    for (std::size_t k = 0; k < prefix; ++k) {
        edits.push_back(Edit{.op = EditOp::kEqual, .old_index = k, .new_index = k});
    }

    std::size_t i = 0;
    std::size_t j = 0;
    while (i < n || j < m) {
        if (i < n && j < m && old_lines[prefix + i] == new_lines[prefix + j]) {
            edits.push_back(
                Edit{.op = EditOp::kEqual, .old_index = prefix + i, .new_index = prefix + j});
            ++i;
            ++j;
        } else if (j == m || (i < n && lcs[at(i + 1, j)] >= lcs[at(i, j + 1)])) {
            edits.push_back(Edit{.op = EditOp::kDelete, .old_index = prefix + i, .new_index = 0});
            ++i;
        } else {
            edits.push_back(Edit{.op = EditOp::kInsert, .old_index = 0, .new_index = prefix + j});
            ++j;
        }
    }

    for (std::size_t k = 0; k < suffix; ++k) {
        edits.push_back(Edit{.op = EditOp::kEqual,
                             .old_index = prefix + n + k,
                             .new_index = prefix + m + k});
    }
    return edits;
}

std::vector<evidence::DiffHunk> build_hunks(const std::string& file_path,
                                            const std::vector<std::string>& old_lines,
                                            const std::vector<std::string>& new_lines,
                                            const std::vector<Edit>& edits,
                                            std::uint32_t context_lines)
{
    std::vector<std::size_t> changes;
    for (std::size_t k = 0; k < edits.size(); ++k) {
        if (edits[k].op != EditOp::kEqual) {
            changes.push_back(k);
        }
    }

    std::vector<evidence::DiffHunk> hunks;
    const std::size_t context = context_lines;
    std::size_t group_begin = 0;
    while (group_begin < changes.size()) {
        std::size_t group_end = group_begin;
        while (group_end + 1 < changes.size()
               && changes[group_end + 1] - changes[group_end] - 1 <= 2 * context) {
            ++group_end;
        }

        const std::size_t first = changes[group_begin] >= context ? changes[group_begin] - context : 0;
        const std::size_t last = std::min(edits.size(), changes[group_end] + 1 + context);

        std::uint32_t old_before = 0;
        std::uint32_t new_before = 0;
        for (std::size_t k = 0; k < first; ++k) {
            old_before += edits[k].op != EditOp::kInsert ? 1U : 0U;
            new_before += edits[k].op != EditOp::kDelete ? 1U : 0U;
        }

        evidence::DiffHunk hunk;
        hunk.file_path = file_path;
        for (std::size_t k = first; k < last; ++k) {
            const Edit& edit = edits[k];
            switch (edit.op) {
                case EditOp::kEqual:
                    hunk.lines.push_back(" " + old_lines[edit.old_index]);
                    ++hunk.old_count;
                    ++hunk.new_count;
                    break;
                case EditOp::kDelete:
                    hunk.lines.push_back("-" + old_lines[edit.old_index]);
                    ++hunk.old_count;
                    break;
                case EditOp::kInsert:
                    hunk.lines.push_back("+" + new_lines[edit.new_index]);
                    ++hunk.new_count;
                    break;
            }
        }
        hunk.old_start = hunk.old_count > 0 ? old_before + 1 : old_before;
        hunk.new_start = hunk.new_count > 0 ? new_before + 1 : new_before;
        hunk.hunk_id = evidence::make_hunk_id(hunk);
        hunks.push_back(std::move(hunk));

        group_begin = group_end + 1;
    }
    return hunks;
}

}  // namespace ossensor::source
