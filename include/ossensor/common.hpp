#pragma once

/**
 * @file common.hpp
 * @brief Common utilities: error type, hash, stable ids, path normalization
 */

#include <cstdint>
#include <expected>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ossensor {

/**
 * @brief Error information for Result types
 */
struct Error
{
    std::string code;     ///< Machine-readable error code
    std::string message;  ///< Human-readable error message

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }
};

/**
 * @brief Result type using std::expected (C++23)
 * @tparam T Success value type
 */
template <typename T>
using Result = std::expected<T, Error>;

/**
 * @brief Result type for void success using std::expected (C++23)
 */
using VoidResult = std::expected<void, Error>;

}  // namespace ossensor

namespace ossensor::common {

// ============================================================================
// SHA-256 Hash
// ============================================================================

/**
 * Compute SHA-256 hash of data
 * @param data Input bytes
 * @return Hex-encoded hash string (64 characters)
 */
[[nodiscard]] std::string sha256(std::string_view data);

/**
 * Compute SHA-256 hash of data with prefix
 * @param data Input bytes
 * @return "sha256:" + hex-encoded hash
 */
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

// ============================================================================
// Stable Identifiers
// ============================================================================

/// Number of hex digits kept from the digest in a stable id
constexpr std::size_t kStableDigestLength = 16;

/**
 * Digest a tuple of fields into a short hex key.
 * Fields are joined with the unit separator (0x1f) so that ("ab","c")
 * and ("a","bc") never collide.
 * @return First kStableDigestLength hex digits of SHA-256
 */
[[nodiscard]] std::string short_digest(std::initializer_list<std::string_view> fields);

/**
 * Build a kind-namespaced stable id: prefix + short_digest(fields)
 * @param prefix Kind prefix including the colon (e.g. "hunk:")
 */
[[nodiscard]] std::string make_stable_id(std::string_view prefix,
                                         std::initializer_list<std::string_view> fields);

// ============================================================================
// UTF-8
// ============================================================================

/**
 * Strict UTF-8 check (rejects overlongs, surrogates and code points past U+10FFFF)
 */
[[nodiscard]] bool is_valid_utf8(std::string_view text);

/**
 * Copy text, replacing every byte that is not part of a valid UTF-8
 * sequence with '?'. Used on free-form input before it reaches JSON.
 */
[[nodiscard]] std::string sanitize_utf8(std::string_view text);

/**
 * Cut text to at most max_bytes without splitting a multi-byte sequence.
 */
[[nodiscard]] std::string truncate_utf8(std::string_view text, std::size_t max_bytes);

// ============================================================================
// Path Normalization
// ============================================================================

/**
 * Normalize a path for deterministic output
 * - Use '/' as separator
 * - Remove trailing slashes
 * - Resolve '..' and '.'
 * - Optionally make relative to repo_root
 *
 * @param input Input path
 * @param repo_root Optional repository root for relative paths
 * @return Normalized path
 */
[[nodiscard]] std::string normalize_path(std::string_view input, std::string_view repo_root = "");

/**
 * Check if path is absolute
 */
[[nodiscard]] bool is_absolute_path(std::string_view path);

/**
 * Make path relative to base
 */
[[nodiscard]] std::string make_relative(std::string_view path, std::string_view base);

}  // namespace ossensor::common
