/**
 * @file scoring.cpp
 * @brief ScoringEngine, Reason and ScoreResult serialization
 */

#include "ossensor/scoring.hpp"

#include "ossensor/version.hpp"

#include <cmath>
#include <utility>

#include <spdlog/spdlog.h>

namespace ossensor::scoring {

// ============================================================================
// Reason
// ============================================================================

Reason::Reason(std::string rule_id, std::string text, double score_contribution, std::vector<evidence::EvidenceRef> refs)
    : m_rule_id(std::move(rule_id))
    , m_text(std::move(text))
    , m_score_contribution(score_contribution)
    , m_evidence_refs(std::move(refs))
{}

ossensor::Result<Reason> Reason::make(std::string rule_id,
                                      std::string text,
                                      double score_contribution,
                                      std::vector<evidence::EvidenceRef> evidence_refs)
{
    if (evidence_refs.empty()) {
        return std::unexpected(Error::make("EmptyEvidence", "Reason from rule " + rule_id + " cites no evidence"));
    }
    if (!std::isfinite(score_contribution)) {
        return std::unexpected(
            Error::make("NonFiniteNumber", "Reason from rule " + rule_id + " has a non-finite contribution"));
    }
    return Reason(std::move(rule_id), std::move(text), score_contribution, std::move(evidence_refs));
}

// ============================================================================
// ScoringWeights
// ============================================================================

ScoringWeights::ScoringWeights()
{
    for (const auto& rule : ruleset()) {
        m_weights.emplace(std::string(rule.rule_id), rule.default_weight);
    }
}

ossensor::VoidResult ScoringWeights::set(std::string_view rule_id, double weight)
{
    auto it = m_weights.find(rule_id);
    if (it == m_weights.end()) {
        return std::unexpected(Error::make("InvalidConfig", "Unknown scoring rule: " + std::string(rule_id)));
    }
    if (!std::isfinite(weight)) {
        return std::unexpected(
            Error::make("InvalidConfig", "Weight for " + std::string(rule_id) + " must be a finite number"));
    }
    it->second = weight;
    return {};
}

double ScoringWeights::get(std::string_view rule_id) const
{
    auto it = m_weights.find(rule_id);
    return it == m_weights.end() ? 0.0 : it->second;
}

// ============================================================================
// ScoreResult JSON
// ============================================================================

nlohmann::json to_json(const ScoreResult& result)
{
    nlohmann::json reasons = nlohmann::json::array();
    for (const auto& reason : result.reasons) {
        reasons.push_back({
            {           "rule_id",            reason.rule_id()},
            {              "text",               reason.text()},
            {"score_contribution", reason.score_contribution()},
            {     "evidence_refs",      reason.evidence_refs()}
        });
    }
    nlohmann::json weights = nlohmann::json::object();
    for (const auto& [rule_id, weight] : result.weights) {
        weights[rule_id] = weight;
    }
    return nlohmann::json{
        { "schema_version",    kScoreSchemaVersion},
        {        "diff_id",         result.diff_id},
        {"ruleset_version", result.ruleset_version},
        {        "weights",                weights},
        {    "total_score",     result.total_score},
        {        "reasons",                reasons}
    };
}

ossensor::Result<ScoreResult> score_result_from_json(const nlohmann::json& j)
{
    try {
        if (j.at("schema_version").get<std::string>() != kScoreSchemaVersion) {
            return std::unexpected(Error::make("ParseError",
                                               "Unsupported score schema_version: "
                                                   + j.at("schema_version").get<std::string>()));
        }
        ScoreResult result;
        result.diff_id = j.at("diff_id").get<std::string>();
        result.ruleset_version = j.at("ruleset_version").get<std::string>();
        result.total_score = j.at("total_score").get<double>();
        for (const auto& [rule_id, weight] : j.at("weights").items()) {
            result.weights.emplace(rule_id, weight.get<double>());
        }
        for (const auto& entry : j.at("reasons")) {
            std::vector<evidence::EvidenceRef> refs;
            for (const auto& ref_json : entry.at("evidence_refs")) {
                auto ref = evidence::ref_from_json(ref_json);
                if (!ref) {
                    return std::unexpected(ref.error());
                }
                refs.push_back(std::move(*ref));
            }
            auto reason = Reason::make(entry.at("rule_id").get<std::string>(),
                                       entry.at("text").get<std::string>(),
                                       entry.at("score_contribution").get<double>(),
                                       std::move(refs));
            if (!reason) {
                return std::unexpected(reason.error());
            }
            result.reasons.push_back(std::move(*reason));
        }
        return result;
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(Error::make("ParseError", std::string("Invalid score result: ") + ex.what()));
    }
}

// ============================================================================
// ScoringEngine
// ============================================================================

ScoringEngine::ScoringEngine(ScoringWeights weights)
    : m_weights(std::move(weights))
{}

ossensor::Result<ScoreResult> ScoringEngine::score(const bundle::EvidenceBundle& bundle) const
{
    ScoreResult result;
    result.diff_id = bundle.diff_id();
    result.ruleset_version = kRulesetVersion;
    result.weights = m_weights.values();

    for (const auto& rule : ruleset()) {
        const double weight = m_weights.get(rule.rule_id);
        for (auto& match : rule.evaluate(bundle)) {
            if (auto cited = bundle.validate_refs(match.refs); !cited) {
                return std::unexpected(Error::make(
                    cited.error().code, "Rule " + std::string(rule.rule_id) + ": " + cited.error().message));
            }
            auto reason = Reason::make(std::string(rule.rule_id), std::move(match.text), weight, std::move(match.refs));
            if (!reason) {
                return std::unexpected(reason.error());
            }
            result.total_score += reason->score_contribution();
            result.reasons.push_back(std::move(*reason));
        }
    }
    if (!std::isfinite(result.total_score)) {
        return std::unexpected(Error::make("NonFiniteNumber", "Total score of " + bundle.diff_id() + " overflowed"));
    }

    spdlog::debug("scored {}: {} reasons, total {}", result.diff_id, result.reasons.size(), result.total_score);
    return result;
}

}  // namespace ossensor::scoring
