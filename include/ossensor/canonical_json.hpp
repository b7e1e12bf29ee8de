#pragma once

/**
 * @file canonical_json.hpp
 * @brief Canonical JSON serialization for deterministic output and hashing
 *
 * Rules:
 * - UTF-8 encoding
 * - Object keys in lexicographic order
 * - No whitespace (minimal representation)
 * - Numbers must be finite; NaN and infinities are rejected
 * - Array order is preserved (producers emit arrays in contract order)
 */

#include "ossensor/common.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace ossensor::canonical {

/**
 * Serialize JSON to canonical form
 * @param j JSON value
 * @return Canonical byte string or error
 */
[[nodiscard]] ossensor::Result<std::string> canonicalize(const nlohmann::json& j);

/**
 * Compute SHA-256 hash of canonical JSON
 * @param j JSON value
 * @return "sha256:" + hex hash or error
 */
[[nodiscard]] ossensor::Result<std::string> hash_canonical(const nlohmann::json& j);

/**
 * Sort JSON object keys recursively
 * @param j JSON value (modified in place)
 */
void sort_keys_recursive(nlohmann::json& j);

/**
 * Validate JSON for canonical form requirements (finite numbers only)
 * @param j JSON value
 * @return Empty on success, error on failure
 */
[[nodiscard]] ossensor::VoidResult validate_for_canonical(const nlohmann::json& j);

/**
 * Write canonical JSON followed by a newline
 */
[[nodiscard]] ossensor::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                                             const nlohmann::json& payload);

}  // namespace ossensor::canonical
