#pragma once

/**
 * @file version.hpp
 * @brief OSS-Sensor version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

#include <string>

namespace ossensor {

/// OSS-Sensor version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Scoring rule set version (embedded in every score result)
constexpr const char* kRulesetVersion = "rules.v1";

/// Schema versions of persisted documents
constexpr const char* kBundleSchemaVersion = "evidence_bundle.v1";
constexpr const char* kScoreSchemaVersion = "score_result.v1";
constexpr const char* kTriageSchemaVersion = "triage_report.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";

struct ToolInfo
{
    std::string name;
    std::string version;
    std::string build_id;
};

[[nodiscard]] inline ToolInfo default_tool_info()
{
    return ToolInfo{.name = "ossensor", .version = kVersion, .build_id = kBuildId};
}

}  // namespace ossensor
