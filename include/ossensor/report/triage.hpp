#pragma once

/**
 * @file triage.hpp
 * @brief Rules-only triage report over a bundle and its score
 */

#include "ossensor/bundle.hpp"
#include "ossensor/common.hpp"
#include "ossensor/evidence.hpp"
#include "ossensor/scoring.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ossensor::report {

enum class TriageFormat { kText, kJson };

/// A statement that can be checked by running the `to` build
struct Hypothesis
{
    std::string statement;
    std::vector<evidence::EvidenceRef> evidence_refs;
};

struct TriageReport
{
    std::string diff_id;
    std::string summary;
    std::vector<std::string> explanation;             ///< One line per reason, reason order
    std::vector<evidence::EvidenceRef> citations;     ///< De-duplicated reason refs, first-seen order
    std::vector<Hypothesis> hypotheses;               ///< One per source feature
    std::optional<nlohmann::json> enrichment;         ///< Accepted enrichment document, if any
};

/**
 * Build the report. Every citation and hypothesis ref is checked against
 * the bundle.
 *
 * @return InvalidArgument when the score belongs to another bundle,
 *         DanglingReference when a ref does not resolve
 */
[[nodiscard]] ossensor::Result<TriageReport> build_triage_report(const bundle::EvidenceBundle& bundle,
                                                                 const scoring::ScoreResult& score);

/**
 * Attach an enrichment document after enforce_citation_policy accepts it.
 */
[[nodiscard]] ossensor::VoidResult attach_enrichment(TriageReport& report,
                                                     const bundle::EvidenceBundle& bundle,
                                                     nlohmann::json enrichment);

[[nodiscard]] nlohmann::json to_json(const TriageReport& report);

/// Human-readable rendering, one entry per output line
[[nodiscard]] std::vector<std::string> render_text(const TriageReport& report,
                                                   const scoring::ScoreResult& score);

/**
 * Write the report in the requested format. JSON output is canonical and
 * validated against triage_report.v1 in schema_dir.
 */
[[nodiscard]] ossensor::VoidResult write_triage_report(const TriageReport& report,
                                                       const scoring::ScoreResult& score,
                                                       TriageFormat format,
                                                       const std::filesystem::path& output_path,
                                                       const std::filesystem::path& schema_dir);

}  // namespace ossensor::report
