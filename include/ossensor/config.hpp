#pragma once

/**
 * @file config.hpp
 * @brief AnalysisConfig: tunables of every pipeline component
 *
 * Defaults are compiled in; a config.v1 JSON document overrides any subset.
 */

#include "ossensor/binary_features.hpp"
#include "ossensor/common.hpp"
#include "ossensor/log_correlation.hpp"
#include "ossensor/log_templates.hpp"
#include "ossensor/scoring.hpp"
#include "ossensor/source_diff.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace ossensor::config {

struct AnalysisConfig
{
    source::SourceDiffOptions source;
    binary::BinaryExtractOptions binary;
    logs::LogTemplateOptions logs;
    logs::CorrelationOptions correlation;
    scoring::ScoringWeights weights;
};

/**
 * Apply a config document on top of the defaults. The document is assumed
 * to have passed schema validation; semantic checks (unknown rule ids,
 * zero-sized limits) are done here.
 *
 * @return InvalidConfig on a semantic error
 */
[[nodiscard]] ossensor::Result<AnalysisConfig> config_from_json(const nlohmann::json& j);

/**
 * Read, schema-validate (config.v1) and apply a config file.
 */
[[nodiscard]] ossensor::Result<AnalysisConfig> load_config(const std::filesystem::path& path,
                                                           const std::filesystem::path& schema_dir);

/// Effective configuration as a config.v1 document
[[nodiscard]] nlohmann::json to_json(const AnalysisConfig& config);

}  // namespace ossensor::config
