#pragma once

/**
 * @file scoring.hpp
 * @brief ScoringEngine: versioned rule set turning a bundle into a cited score
 *
 * Rules are data: an ordered table of {rule_id, description, default
 * weight, evaluate}. reasons[] follow table order, and within a rule the
 * order in which evaluate() reports its matches.
 */

#include "ossensor/bundle.hpp"
#include "ossensor/common.hpp"
#include "ossensor/evidence.hpp"

#include <functional>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ossensor::scoring {

/**
 * @brief One scored explanation. Never without evidence.
 */
class Reason
{
public:
    /**
     * @return EmptyEvidence when evidence_refs is empty
     */
    [[nodiscard]] static ossensor::Result<Reason> make(std::string rule_id,
                                                       std::string text,
                                                       double score_contribution,
                                                       std::vector<evidence::EvidenceRef> evidence_refs);

    [[nodiscard]] const std::string& rule_id() const { return m_rule_id; }
    [[nodiscard]] const std::string& text() const { return m_text; }
    [[nodiscard]] double score_contribution() const { return m_score_contribution; }
    [[nodiscard]] const std::vector<evidence::EvidenceRef>& evidence_refs() const { return m_evidence_refs; }

private:
    Reason(std::string rule_id, std::string text, double score_contribution, std::vector<evidence::EvidenceRef> refs);

    std::string m_rule_id;
    std::string m_text;
    double m_score_contribution;
    std::vector<evidence::EvidenceRef> m_evidence_refs;
};

/// What a rule found: the reason text and the evidence behind it
struct RuleMatch
{
    std::string text;
    std::vector<evidence::EvidenceRef> refs;
};

using RuleEvaluator = std::function<std::vector<RuleMatch>(const bundle::EvidenceBundle&)>;

struct RuleDefinition
{
    std::string_view rule_id;
    std::string_view description;
    double default_weight;
    RuleEvaluator evaluate;
};

/// The rules.v1 table in declaration order
[[nodiscard]] const std::vector<RuleDefinition>& ruleset();

/// nullptr when rule_id is not part of the rule set
[[nodiscard]] const RuleDefinition* find_rule(std::string_view rule_id);

/**
 * @brief Contribution per rule id. Starts from the rule set defaults.
 */
class ScoringWeights
{
public:
    ScoringWeights();

    /**
     * @return InvalidConfig for an unknown rule id or a non-finite weight
     */
    [[nodiscard]] ossensor::VoidResult set(std::string_view rule_id, double weight);

    [[nodiscard]] double get(std::string_view rule_id) const;

    [[nodiscard]] const std::map<std::string, double, std::less<>>& values() const { return m_weights; }

private:
    std::map<std::string, double, std::less<>> m_weights;
};

struct ScoreResult
{
    std::string diff_id;
    std::string ruleset_version;
    std::map<std::string, double, std::less<>> weights;
    double total_score = 0.0;
    std::vector<Reason> reasons;
};

[[nodiscard]] nlohmann::json to_json(const ScoreResult& result);

/// Inverse of to_json; reasons go back through Reason::make
[[nodiscard]] ossensor::Result<ScoreResult> score_result_from_json(const nlohmann::json& j);

/**
 * Pure function of (bundle, weights): no I/O, no artifact lookups.
 */
class ScoringEngine
{
public:
    explicit ScoringEngine(ScoringWeights weights = {});

    /**
     * Evaluate every rule against the bundle.
     *
     * A bundle that matches nothing scores 0 with no reasons. Every cited
     * ref is checked against the bundle before the result is returned.
     *
     * @return DanglingReference or EmptyEvidence on a rule defect
     */
    [[nodiscard]] ossensor::Result<ScoreResult> score(const bundle::EvidenceBundle& bundle) const;

    [[nodiscard]] const ScoringWeights& weights() const { return m_weights; }

private:
    ScoringWeights m_weights;
};

}  // namespace ossensor::scoring
