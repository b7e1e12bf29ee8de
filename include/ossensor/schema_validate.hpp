#pragma once

/**
 * @file schema_validate.hpp
 * @brief JSON file loading and JSON Schema validation utilities
 */

#include "ossensor/common.hpp"

#include <filesystem>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace ossensor::common {

/**
 * Read and parse a JSON document from disk.
 * @return Parsed document, or IOError / ParseError
 */
[[nodiscard]] ossensor::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/**
 * Validate JSON against a JSON Schema file.
 *
 * Schemas may reference siblings with "ossensor:schema/<name>"; those are
 * resolved to "<schema dir>/<name>.schema.json".
 *
 * @param j JSON document to validate
 * @param schema_path Path to JSON Schema file
 * @return Empty on success, error on failure
 */
[[nodiscard]] ossensor::VoidResult validate_json(const nlohmann::json& j,
                                                 const std::string& schema_path);

/**
 * Validate against "<schema_dir>/<schema_version>.schema.json".
 */
[[nodiscard]] ossensor::VoidResult validate_json_version(const nlohmann::json& j,
                                                         const std::filesystem::path& schema_dir,
                                                         std::string_view schema_version);

}  // namespace ossensor::common
