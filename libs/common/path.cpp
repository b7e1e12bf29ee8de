/**
 * @file path.cpp
 * @brief Path normalization for deterministic output
 *
 * Source tree file lists are keyed by these normalized relative paths, so
 * the same tree checked out on two hosts produces the same hunk ordering.
 */

#include "ossensor/common.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <ranges>
#include <string>
#include <vector>

namespace ossensor::common {

namespace {

/**
 * @brief Split a path on '/' and '\\', dropping empty components
 */
[[nodiscard]] std::vector<std::string> split_path(std::string_view path)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/' || c == '\\') {
            if (!current.empty()) {
                parts.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current += c;
    }
    if (!current.empty()) {
        parts.push_back(std::move(current));
    }
    return parts;
}

/// Lower-cased drive prefix ("c:") when the path carries one
[[nodiscard]] std::string drive_prefix(std::string_view path)
{
    if (path.size() >= 2 && path[1] == ':'
        && std::isalpha(static_cast<unsigned char>(path[0])) != 0) {
        return std::string(1, static_cast<char>(std::tolower(static_cast<unsigned char>(path[0]))))
               + ":";
    }
    return {};
}

[[nodiscard]] std::vector<std::string> resolve_dots(const std::vector<std::string>& parts,
                                                    bool absolute_input)
{
    std::vector<std::string> resolved;
    for (const auto& part : parts) {
        if (part == ".") {
            continue;
        }
        if (part == "..") {
            if (!resolved.empty() && resolved.back() != "..") {
                resolved.pop_back();
            } else if (!absolute_input) {
                resolved.emplace_back("..");
            }
            continue;
        }
        resolved.push_back(part);
    }
    return resolved;
}

[[nodiscard]] std::string join_path(const std::vector<std::string>& parts)
{
    std::string result;
    for (const auto& p : parts) {
        if (!result.empty()) {
            result += '/';
        }
        result += p;
    }
    return result;
}

}  // namespace

bool is_absolute_path(std::string_view path)
{
    if (path.empty()) {
        return false;
    }
    if (path[0] == '/') {
        return true;
    }
    // Drive letter (C:\ or C:/)
    if (path.size() >= 3 && !drive_prefix(path).empty() && (path[2] == '/' || path[2] == '\\')) {
        return true;
    }
    // UNC path
    return path.size() >= 2 && path[0] == '\\' && path[1] == '\\';
}

std::string normalize_path(std::string_view input, std::string_view repo_root)
{
    if (input.empty()) {
        return ".";
    }
    const bool absolute_input = is_absolute_path(input);
    const std::string drive = drive_prefix(input);
    auto parts = split_path(input.substr(drive.size()));
    std::string normalized = join_path(resolve_dots(parts, absolute_input));

    if (!drive.empty()) {
        normalized = drive + "/" + normalized;
        if (normalized.ends_with('/')) {
            normalized.pop_back();
        }
    } else if (absolute_input) {
        normalized = "/" + normalized;
    }

    if (!repo_root.empty()) {
        const std::string norm_root = normalize_path(repo_root);
        if (normalized == norm_root) {
            return ".";
        }
        if (normalized.starts_with(norm_root + "/")) {
            normalized = normalized.substr(norm_root.size() + 1);
        } else if (norm_root == "/" && normalized.starts_with('/')) {
            normalized = normalized.substr(1);
        }
    }

    return normalized.empty() ? "." : normalized;
}

std::string make_relative(std::string_view path, std::string_view base)
{
    auto path_parts = split_path(normalize_path(path));
    auto base_parts = split_path(normalize_path(base));
    if (base_parts.size() == 1 && base_parts.front() == ".") {
        base_parts.clear();
    }

    std::size_t common = 0;
    while (common < path_parts.size() && common < base_parts.size()
           && path_parts[common] == base_parts[common]) {
        ++common;
    }

    std::vector<std::string> result(base_parts.size() - common, "..");
    for (const auto& part : path_parts | std::views::drop(static_cast<std::ptrdiff_t>(common))) {
        result.push_back(part);
    }
    return result.empty() ? "." : join_path(result);
}

}  // namespace ossensor::common
