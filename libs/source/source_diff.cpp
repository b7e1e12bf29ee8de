/**
 * @file source_diff.cpp
 * @brief SourceDiffAnalyzer implementation
 */

#include "ossensor/source_diff.hpp"

#include "feature_patterns.hpp"
#include "line_diff.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <sstream>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace ossensor::source {

namespace {

using evidence::ChangeSide;
using evidence::DiffHunk;
using evidence::FeatureKind;
using evidence::SkipNotice;
using evidence::SourceFeature;

constexpr std::size_t kMaxSnippetLength = 200;

/// Reason a file cannot be diffed as text, or empty when it can
[[nodiscard]] std::string undecodable_reason(const SourceText& file)
{
    if (!file.readable) {
        return "unreadable file";
    }
    const std::string_view content = file.content;
    if (content.find('\0') != std::string_view::npos) {
        return "binary content (NUL byte)";
    }
    if (!common::is_valid_utf8(content)) {
        return "not valid UTF-8 text";
    }
    return {};
}

[[nodiscard]] ossensor::Result<std::vector<SourceText>> load_tree(const std::filesystem::path& root)
{
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        return std::unexpected(
            Error::make("IOError", "Source tree is not a directory: " + root.string()));
    }

    std::vector<SourceText> files;
    std::filesystem::recursive_directory_iterator it(
        root, std::filesystem::directory_options::skip_permission_denied, ec);
    if (ec) {
        return std::unexpected(
            Error::make("IOError", "Failed to walk source tree " + root.string() + ": " + ec.message()));
    }
    for (; it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to walk source tree " + root.string() + ": " + ec.message()));
        }
        const auto& entry = *it;
        if (entry.path().filename().string().starts_with('.')) {
            if (entry.is_directory(ec)) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        std::ifstream in(entry.path(), std::ios::binary);
        std::string relative =
            common::sanitize_utf8(common::make_relative(entry.path().generic_string(), root.generic_string()));
        if (!in) {
            // Reported per file as a skip notice, not as a tree failure
            files.push_back(SourceText{.path = std::move(relative), .content = {}, .readable = false});
            continue;
        }
        std::ostringstream buffer;
        buffer << in.rdbuf();
        files.push_back(SourceText{.path = std::move(relative), .content = buffer.str(), .readable = true});
    }
    return files;
}

/// A line visible on one side of a hunk
struct SideLine
{
    std::uint32_t line_no;
    std::string code;  ///< Comment-stripped line body
    bool changed;
};

/// Lines past max_line_length keep their numbering but carry no code
[[nodiscard]] std::vector<SideLine> side_view(const DiffHunk& hunk, ChangeSide side, std::size_t max_line_length)
{
    const char changed_marker = side == ChangeSide::kAdded ? '+' : '-';
    std::uint32_t line_no = side == ChangeSide::kAdded ? hunk.new_start : hunk.old_start;
    std::vector<SideLine> lines;
    for (const auto& line : hunk.lines) {
        if (line.empty()) {
            continue;
        }
        const char marker = line.front();
        if (marker != ' ' && marker != changed_marker) {
            continue;
        }
        const std::string_view body = std::string_view(line).substr(1);
        if (body.size() > max_line_length) {
            spdlog::debug("source diff: {}:{} exceeds {} bytes, not classified",
                          hunk.file_path, line_no, max_line_length);
        }
        lines.push_back(SideLine{.line_no = line_no,
                                 .code = body.size() > max_line_length ? std::string{}
                                                                      : patterns::strip_comment(body),
                                 .changed = marker == changed_marker});
        ++line_no;
    }
    return lines;
}

struct FeatureAccumulator
{
    std::vector<std::uint32_t> lines;
    std::string snippet;
    bool all_guarded = true;
};

[[nodiscard]] std::string make_snippet(std::string_view code)
{
    std::string snippet = common::truncate_utf8(code, kMaxSnippetLength);
    while (!snippet.empty() && (snippet.back() == ' ' || snippet.back() == '\t')) {
        snippet.pop_back();
    }
    return snippet;
}

}  // namespace

SourceDiffAnalyzer::SourceDiffAnalyzer(SourceDiffOptions options)
    : m_options(options)
{}

ossensor::Result<SourceDiffResult>
SourceDiffAnalyzer::analyze_trees(const std::optional<std::filesystem::path>& from_root,
                                  const std::optional<std::filesystem::path>& to_root) const
{
    std::vector<SourceText> from_files;
    std::vector<SourceText> to_files;
    if (from_root) {
        auto loaded = load_tree(*from_root);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        from_files = std::move(*loaded);
    }
    if (to_root) {
        auto loaded = load_tree(*to_root);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        to_files = std::move(*loaded);
    }
    spdlog::debug("source diff: {} files before, {} files after", from_files.size(), to_files.size());
    return analyze_texts(from_files, to_files);
}

SourceDiffResult SourceDiffAnalyzer::analyze_texts(const std::vector<SourceText>& from_files,
                                                   const std::vector<SourceText>& to_files) const
{
    // path -> (before, after); std::map gives the sorted union
    std::map<std::string, std::pair<const SourceText*, const SourceText*>> paired;
    for (const auto& file : from_files) {
        paired[common::normalize_path(file.path)].first = &file;
    }
    for (const auto& file : to_files) {
        paired[common::normalize_path(file.path)].second = &file;
    }

    SourceDiffResult result;
    for (const auto& [path, sides] : paired) {
        const auto& [before, after] = sides;

        std::string reason;
        if (before != nullptr) {
            reason = undecodable_reason(*before);
        }
        if (reason.empty() && after != nullptr) {
            reason = undecodable_reason(*after);
        }
        if (!reason.empty()) {
            spdlog::warn("source diff: skipping {}: {}", path, reason);
            result.skips.push_back(SkipNotice{.file_path = path, .reason = std::move(reason)});
            continue;
        }

        const auto old_lines = before != nullptr ? split_lines(before->content) : std::vector<std::string>{};
        const auto new_lines = after != nullptr ? split_lines(after->content) : std::vector<std::string>{};
        auto edits = diff_lines(old_lines, new_lines, m_options.max_lcs_cells);
        if (!edits) {
            spdlog::warn("source diff: skipping {}: diff too large", path);
            result.skips.push_back(SkipNotice{.file_path = path, .reason = "diff too large"});
            continue;
        }

        auto hunks = build_hunks(path, old_lines, new_lines, *edits, m_options.context_lines);
        if (hunks.empty() && (before == nullptr) != (after == nullptr)) {
            // An empty file added or removed still shows up, as a 0/0 hunk with no lines
            DiffHunk sentinel;
            sentinel.file_path = path;
            sentinel.hunk_id = evidence::make_hunk_id(sentinel);
            hunks.push_back(std::move(sentinel));
        }
        for (auto& hunk : hunks) {
            auto features = derive_features(hunk);
            std::ranges::move(features, std::back_inserter(result.features));
            result.hunks.push_back(std::move(hunk));
        }
    }

    spdlog::debug("source diff: {} hunks, {} features, {} skipped files",
                  result.hunks.size(),
                  result.features.size(),
                  result.skips.size());
    return result;
}

std::vector<SourceFeature> SourceDiffAnalyzer::derive_features(const DiffHunk& hunk) const
{
    // (kind, side) -> accumulated triggers; map order is enum order
    std::map<std::pair<FeatureKind, ChangeSide>, FeatureAccumulator> found;
    const auto record = [&found](FeatureKind kind, ChangeSide side, const SideLine& line, bool guarded) {
        auto& acc = found[{kind, side}];
        if (acc.lines.empty()) {
            acc.snippet = make_snippet(line.code);
        }
        acc.lines.push_back(line.line_no);
        acc.all_guarded = acc.all_guarded && guarded;
    };

    const std::size_t window = m_options.guard_window;
    for (const ChangeSide side : {ChangeSide::kAdded, ChangeSide::kRemoved}) {
        const bool added = side == ChangeSide::kAdded;
        const auto lines = side_view(hunk, side, m_options.max_line_length);
        for (std::size_t idx = 0; idx < lines.size(); ++idx) {
            const SideLine& line = lines[idx];
            if (!line.changed || line.code.empty()) {
                continue;
            }

            if (patterns::is_allocation_sizing(line.code)) {
                bool guarded = patterns::has_overflow_check(line.code);
                for (std::size_t back = 1; !guarded && back <= window && back <= idx; ++back) {
                    guarded = patterns::is_guard(lines[idx - back].code);
                }
                record(FeatureKind::kAllocationSizing, side, line, guarded);
            }

            if (patterns::is_guard(line.code)) {
                const std::size_t end = std::min(lines.size(), idx + window + 1);
                const bool guards_call = std::any_of(
                    lines.begin() + static_cast<std::ptrdiff_t>(idx),
                    lines.begin() + static_cast<std::ptrdiff_t>(end),
                    [](const SideLine& candidate) {
                        return patterns::is_allocation_call(candidate.code)
                               || patterns::is_memory_copy(candidate.code);
                    });
                if (guards_call) {
                    record(added ? FeatureKind::kBoundsCheckAdded : FeatureKind::kBoundsCheckRemoved,
                           side,
                           line,
                           true);
                }
            }

            if (patterns::is_parsing_marker(line.code)) {
                record(FeatureKind::kParsingLogic, side, line, true);
            }

            if (patterns::is_privilege_check(line.code)) {
                record(added ? FeatureKind::kPrivilegeCheckAdded : FeatureKind::kPrivilegeCheckRemoved,
                       side,
                       line,
                       true);
            }
        }
    }

    std::vector<SourceFeature> features;
    features.reserve(found.size());
    for (auto& [key, acc] : found) {
        const auto& [kind, side] = key;
        features.push_back(SourceFeature{
            .feature_id = evidence::make_feature_id(hunk.hunk_id, kind, side),
            .kind = kind,
            .side = side,
            .file_path = hunk.file_path,
            .hunk_ids = {hunk.hunk_id},
            .lines = std::move(acc.lines),
            .guarded = kind == FeatureKind::kAllocationSizing && acc.all_guarded,
            .snippet = std::move(acc.snippet),
        });
    }
    return features;
}

}  // namespace ossensor::source
