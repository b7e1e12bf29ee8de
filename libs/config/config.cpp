/**
 * @file config.cpp
 * @brief config.v1 loading and application
 */

#include "ossensor/config.hpp"

#include "ossensor/schema_validate.hpp"
#include "ossensor/version.hpp"

#include <cstdint>
#include <limits>
#include <string>

#include <spdlog/spdlog.h>

namespace ossensor::config {

namespace {

[[nodiscard]] Error invalid(std::string message)
{
    return Error::make("InvalidConfig", std::move(message));
}

/// Overwrite target with j[key] when present; zero is rejected for limits
template <typename T>
[[nodiscard]] ossensor::VoidResult
apply_limit(const nlohmann::json& section, const char* key, T& target, bool allow_zero = false)
{
    auto it = section.find(key);
    if (it == section.end()) {
        return {};
    }
    if (!it->is_number_unsigned()) {
        return std::unexpected(invalid(std::string(key) + " must be a non-negative integer"));
    }
    const auto value = it->get<std::uint64_t>();
    if (value == 0 && !allow_zero) {
        return std::unexpected(invalid(std::string(key) + " must be positive"));
    }
    if (value > std::numeric_limits<T>::max()) {
        return std::unexpected(invalid(std::string(key) + " is out of range"));
    }
    target = static_cast<T>(value);
    return {};
}

[[nodiscard]] const nlohmann::json* section(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

}  // namespace

ossensor::Result<AnalysisConfig> config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid("Config document must be an object"));
    }
    if (auto it = j.find("schema_version"); it == j.end() || *it != kConfigSchemaVersion) {
        return std::unexpected(invalid(std::string("Config schema_version must be ") + kConfigSchemaVersion));
    }

    AnalysisConfig config;
    if (const auto* s = section(j, "source")) {
        for (auto r : {apply_limit(*s, "context_lines", config.source.context_lines, true),
                       apply_limit(*s, "guard_window", config.source.guard_window, true),
                       apply_limit(*s, "max_lcs_cells", config.source.max_lcs_cells),
                       apply_limit(*s, "max_line_length", config.source.max_line_length)}) {
            if (!r) {
                return std::unexpected(r.error());
            }
        }
    }
    if (const auto* s = section(j, "binary")) {
        for (auto r : {apply_limit(*s, "min_string_length", config.binary.min_string_length),
                       apply_limit(*s, "max_strings", config.binary.max_strings)}) {
            if (!r) {
                return std::unexpected(r.error());
            }
        }
    }
    if (const auto* s = section(j, "logs")) {
        for (auto r : {apply_limit(*s, "max_line_length", config.logs.max_line_length),
                       apply_limit(*s, "max_samples", config.logs.max_samples, true)}) {
            if (!r) {
                return std::unexpected(r.error());
            }
        }
    }
    if (const auto* s = section(j, "correlation")) {
        if (auto r = apply_limit(*s, "min_fragment_length", config.correlation.min_fragment_length); !r) {
            return std::unexpected(r.error());
        }
    }
    if (const auto* s = section(j, "scoring")) {
        if (const auto* weights = section(*s, "weights")) {
            for (const auto& [rule_id, value] : weights->items()) {
                if (!value.is_number()) {
                    return std::unexpected(invalid("Weight for " + rule_id + " must be a number"));
                }
                if (auto r = config.weights.set(rule_id, value.get<double>()); !r) {
                    return std::unexpected(r.error());
                }
            }
        }
    }
    return config;
}

ossensor::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                             const std::filesystem::path& schema_dir)
{
    auto doc = common::read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (auto valid = common::validate_json_version(*doc, schema_dir, kConfigSchemaVersion); !valid) {
        return std::unexpected(invalid("Config " + path.string() + " failed schema validation: "
                                       + valid.error().message));
    }
    auto config = config_from_json(*doc);
    if (config) {
        spdlog::debug("loaded config {}", path.string());
    }
    return config;
}

nlohmann::json to_json(const AnalysisConfig& config)
{
    nlohmann::json weights = nlohmann::json::object();
    for (const auto& [rule_id, weight] : config.weights.values()) {
        weights[rule_id] = weight;
    }
    return nlohmann::json{
        {"schema_version", kConfigSchemaVersion},
        {"source",
         {{"context_lines", config.source.context_lines},
          {"guard_window", config.source.guard_window},
          {"max_lcs_cells", config.source.max_lcs_cells},
          {"max_line_length", config.source.max_line_length}}},
        {"binary",
         {{"min_string_length", config.binary.min_string_length},
          {"max_strings", config.binary.max_strings}}},
        {"logs",
         {{"max_line_length", config.logs.max_line_length},
          {"max_samples", config.logs.max_samples}}},
        {"correlation", {{"min_fragment_length", config.correlation.min_fragment_length}}},
        {"scoring", {{"weights", weights}}},
    };
}

}  // namespace ossensor::config
