/**
 * @file triage.cpp
 * @brief Triage report construction and rendering
 */

#include "ossensor/report/triage.hpp"

#include "ossensor/canonical_json.hpp"
#include "ossensor/report.hpp"
#include "ossensor/schema_validate.hpp"
#include "ossensor/version.hpp"

#include <fstream>
#include <set>
#include <utility>

#include <fmt/format.h>

namespace ossensor::report {

namespace {

using evidence::EvidenceRef;
using evidence::FeatureKind;
using evidence::feature_refs;
using evidence::SourceFeature;

[[nodiscard]] std::string location(const SourceFeature& feature)
{
    if (feature.lines.empty()) {
        return feature.file_path;
    }
    return feature.file_path + ":" + std::to_string(feature.lines.front());
}

[[nodiscard]] std::string hypothesis_text(const SourceFeature& feature,
                                          const std::string& build_from,
                                          const std::string& build_to)
{
    const std::string where = location(feature);
    switch (feature.kind) {
        case FeatureKind::kAllocationSizing:
            if (feature.guarded) {
                return "The guarded size computation at " + where
                       + " should reject element counts whose product overflows; feed counts near SIZE_MAX"
                         " divided by the element size and expect a clean error in "
                       + build_to + ".";
            }
            return "The size computation at " + where
                   + " has no preceding bounds or overflow check; an input count near SIZE_MAX divided by the"
                     " element size should produce an undersized allocation in "
                   + (feature.side == evidence::ChangeSide::kAdded ? build_to : build_from) + ".";
        case FeatureKind::kBoundsCheckAdded:
            return "The check added at " + where + " rejects inputs that " + build_from
                   + " accepted; an input violating it should misbehave on " + build_from
                   + " and be rejected on " + build_to + ".";
        case FeatureKind::kBoundsCheckRemoved:
            return "The check removed at " + where + " lets inputs rejected by " + build_from
                   + " reach the following allocation or copy in " + build_to + ".";
        case FeatureKind::kParsingLogic:
            return "Length or count parsing changed at " + where
                   + "; inputs with oversized or inconsistent length fields should behave differently between "
                   + build_from + " and " + build_to + ".";
        case FeatureKind::kPrivilegeCheckAdded:
            return "The privilege check added at " + where + " suggests the path was reachable without it in "
                   + build_from + "; an unprivileged caller should succeed there and fail on " + build_to + ".";
        case FeatureKind::kPrivilegeCheckRemoved:
            return "The privilege check removed at " + where + " should let an unprivileged caller reach the path in "
                   + build_to + ".";
    }
    return "Feature at " + where + " changed between " + build_from + " and " + build_to + ".";
}

[[nodiscard]] std::string format_ref(const EvidenceRef& ref)
{
    std::string text = std::string(to_string(ref.type)) + " " + ref.stable_id;
    if (ref.artifact_id) {
        text += " @ " + *ref.artifact_id;
    }
    return text;
}

}  // namespace

ossensor::Result<TriageReport> build_triage_report(const bundle::EvidenceBundle& bundle,
                                                   const scoring::ScoreResult& score)
{
    if (score.diff_id != bundle.diff_id()) {
        return std::unexpected(Error::make("InvalidArgument",
                                           "Score result is for " + score.diff_id + ", bundle is "
                                               + bundle.diff_id()));
    }

    TriageReport report;
    report.diff_id = bundle.diff_id();
    report.summary = fmt::format("{} {} -> {}: score {} from {} reasons ({} hunks, {} source features, {} log matches)",
                                 bundle.component(),
                                 bundle.build_from(),
                                 bundle.build_to(),
                                 score.total_score,
                                 score.reasons.size(),
                                 bundle.diff_hunks().size(),
                                 bundle.source_features().size(),
                                 bundle.log_to_binary_matches().size());

    std::set<EvidenceRef> seen;
    for (const auto& reason : score.reasons) {
        report.explanation.push_back(
            fmt::format("[+{}] {}: {}", reason.score_contribution(), reason.rule_id(), reason.text()));
        for (const auto& ref : reason.evidence_refs()) {
            if (seen.insert(ref).second) {
                report.citations.push_back(ref);
            }
        }
    }
    if (auto cited = bundle.validate_refs(report.citations); !cited) {
        return std::unexpected(cited.error());
    }

    for (const auto& feature : bundle.source_features()) {
        Hypothesis hypothesis{.statement = hypothesis_text(feature, bundle.build_from(), bundle.build_to()),
                              .evidence_refs = feature_refs(feature)};
        if (auto cited = bundle.validate_refs(hypothesis.evidence_refs); !cited) {
            return std::unexpected(cited.error());
        }
        report.hypotheses.push_back(std::move(hypothesis));
    }
    return report;
}

ossensor::VoidResult attach_enrichment(TriageReport& report,
                                       const bundle::EvidenceBundle& bundle,
                                       nlohmann::json enrichment)
{
    if (!enrichment.is_object()) {
        return std::unexpected(Error::make("InvalidArgument", "Enrichment document must be a JSON object"));
    }
    if (auto policy = enforce_citation_policy(bundle, enrichment); !policy) {
        return std::unexpected(policy.error());
    }
    report.enrichment = std::move(enrichment);
    return {};
}

nlohmann::json to_json(const TriageReport& report)
{
    nlohmann::json hypotheses = nlohmann::json::array();
    for (const auto& hypothesis : report.hypotheses) {
        hypotheses.push_back({
            {    "statement",     hypothesis.statement},
            {"evidence_refs", hypothesis.evidence_refs}
        });
    }
    nlohmann::json j = {
        {"schema_version", kTriageSchemaVersion},
        {       "diff_id",       report.diff_id},
        {       "summary",       report.summary},
        {   "explanation",   report.explanation},
        {     "citations",     report.citations},
        {    "hypotheses",           hypotheses}
    };
    if (report.enrichment) {
        j["enrichment"] = *report.enrichment;
    }
    return j;
}

std::vector<std::string> render_text(const TriageReport& report, const scoring::ScoreResult& score)
{
    std::vector<std::string> lines;
    lines.push_back("TRIAGE: " + report.diff_id);
    lines.push_back("  " + report.summary);
    lines.push_back(fmt::format("  ruleset: {}", score.ruleset_version));
    if (report.explanation.empty()) {
        lines.emplace_back("  no scoring rule matched");
    } else {
        lines.emplace_back("REASONS:");
        for (std::size_t i = 0; i < score.reasons.size() && i < report.explanation.size(); ++i) {
            lines.push_back("  " + report.explanation[i]);
            for (const auto& ref : score.reasons[i].evidence_refs()) {
                lines.push_back("    - " + format_ref(ref));
            }
        }
    }
    if (!report.hypotheses.empty()) {
        lines.emplace_back("HYPOTHESES:");
        for (const auto& hypothesis : report.hypotheses) {
            lines.push_back("  * " + hypothesis.statement);
            for (const auto& ref : hypothesis.evidence_refs) {
                lines.push_back("    - " + format_ref(ref));
            }
        }
    }
    if (report.enrichment) {
        lines.emplace_back("ENRICHMENT: accepted (all citations resolve)");
    }
    return lines;
}

ossensor::VoidResult write_triage_report(const TriageReport& report,
                                         const scoring::ScoreResult& score,
                                         TriageFormat format,
                                         const std::filesystem::path& output_path,
                                         const std::filesystem::path& schema_dir)
{
    if (format == TriageFormat::kJson) {
        const nlohmann::json j = to_json(report);
        if (auto valid = common::validate_json_version(j, schema_dir, kTriageSchemaVersion); !valid) {
            return std::unexpected(valid.error());
        }
        return canonical::write_canonical_json_file(output_path, j);
    }

    std::ofstream out(output_path);
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to open output file: " + output_path.string()));
    }
    for (const auto& line : render_text(report, score)) {
        out << line << "\n";
    }
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write output file: " + output_path.string()));
    }
    return {};
}

}  // namespace ossensor::report
