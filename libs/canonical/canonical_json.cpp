/**
 * @file canonical_json.cpp
 * @brief Canonical JSON serialization
 */

#include "ossensor/canonical_json.hpp"

#include "ossensor/common.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>
#include <vector>

namespace ossensor::canonical {

namespace {

ossensor::VoidResult validate_finite(const nlohmann::json& j, const std::string& path)
{
    if (j.is_number_float() && !std::isfinite(j.get<double>())) {
        return std::unexpected(
            Error::make("NonFiniteNumber", "Non-finite number not allowed in canonical JSON at: " + path));
    }
    if (j.is_object()) {
        for (const auto& [key, val] : j.items()) {
            if (auto result = validate_finite(val, path + "." + key); !result) {
                return result;
            }
        }
    } else if (j.is_array()) {
        for (std::size_t i = 0; i < j.size(); ++i) {
            if (auto result = validate_finite(j[i], path + "[" + std::to_string(i) + "]");
                !result) {
                return result;
            }
        }
    }
    return {};
}

/**
 * @brief Recursively create a sorted copy of JSON (keys in lexicographic order)
 */
[[nodiscard]] nlohmann::json make_sorted_copy(const nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        keys.reserve(j.size());
        for (const auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json result = nlohmann::json::object();
        for (const auto& key : keys) {
            result[key] = make_sorted_copy(j[key]);
        }
        return result;
    }
    if (j.is_array()) {
        nlohmann::json result = nlohmann::json::array();
        result.get_ref<nlohmann::json::array_t&>().reserve(j.size());
        for (const auto& elem : j) {
            result.push_back(make_sorted_copy(elem));
        }
        return result;
    }
    return j;
}

}  // namespace

ossensor::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto result = validate_finite(j, "$"); !result) {
        return std::unexpected(result.error());
    }

    nlohmann::json sorted = make_sorted_copy(j);

    // Invalid UTF-8 in a string value is an error, never silently replaced
    try {
        return sorted.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(Error::make("InvalidUtf8", ex.what()));
    }
}

ossensor::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    auto canonical = canonicalize(j);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return common::sha256_prefixed(*canonical);
}

void sort_keys_recursive(nlohmann::json& j)
{
    if (j.is_object()) {
        std::vector<std::string> keys;
        for (auto& [key, _] : j.items()) {
            keys.push_back(key);
        }
        std::ranges::sort(keys);

        nlohmann::json sorted = nlohmann::json::object();
        for (const auto& key : keys) {
            sort_keys_recursive(j[key]);
            sorted[key] = std::move(j[key]);
        }
        j = std::move(sorted);
    } else if (j.is_array()) {
        for (auto& elem : j) {
            sort_keys_recursive(elem);
        }
    }
}

ossensor::VoidResult validate_for_canonical(const nlohmann::json& j)
{
    return validate_finite(j, "$");
}

ossensor::VoidResult write_canonical_json_file(const std::filesystem::path& path,
                                               const nlohmann::json& payload)
{
    auto canonical = canonicalize(payload);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    std::ofstream out(path, std::ios::binary);
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to open output file: " + path.string()));
    }
    out << *canonical << "\n";
    if (!out) {
        return std::unexpected(
            Error::make("IOError", "Failed to write output file: " + path.string()));
    }
    return {};
}

}  // namespace ossensor::canonical
