/**
 * @file rules.cpp
 * @brief The rules.v1 scoring rule table
 */

#include "ossensor/scoring.hpp"

#include <algorithm>
#include <set>

namespace ossensor::scoring {

namespace {

using bundle::EvidenceBundle;
using evidence::EvidenceRef;
using evidence::FeatureKind;
using evidence::feature_refs;
using evidence::RefType;
using evidence::SourceFeature;

[[nodiscard]] EvidenceRef local_ref(RefType type, const std::string& stable_id)
{
    return EvidenceRef{.type = type, .artifact_id = std::nullopt, .stable_id = stable_id};
}

[[nodiscard]] EvidenceRef binary_ref(RefType type, const std::string& artifact_id, const std::string& stable_id)
{
    return EvidenceRef{.type = type, .artifact_id = artifact_id, .stable_id = stable_id};
}

[[nodiscard]] std::string describe_lines(const SourceFeature& feature)
{
    std::string text = feature.file_path;
    if (!feature.lines.empty()) {
        text += feature.lines.size() == 1 ? " line " : " lines ";
        for (std::size_t i = 0; i < feature.lines.size(); ++i) {
            if (i > 0) {
                text += ", ";
            }
            text += std::to_string(feature.lines[i]);
        }
    }
    return text;
}

[[nodiscard]] bool shares_hunk(const SourceFeature& a, const SourceFeature& b)
{
    return std::ranges::any_of(a.hunk_ids, [&b](const auto& id) {
        return std::ranges::find(b.hunk_ids, id) != b.hunk_ids.end();
    });
}

/// First bounds-check-added feature sharing a hunk with `feature`, or nullptr
[[nodiscard]] const SourceFeature* paired_bounds_check(const EvidenceBundle& bundle, const SourceFeature& feature)
{
    for (const auto& candidate : bundle.source_features()) {
        if (candidate.kind == FeatureKind::kBoundsCheckAdded && shares_hunk(candidate, feature)) {
            return &candidate;
        }
    }
    return nullptr;
}

[[nodiscard]] std::string side_word(const SourceFeature& feature)
{
    return feature.side == evidence::ChangeSide::kAdded ? "added" : "removed";
}

/// One match per feature of `kind`, text = prefix + location
[[nodiscard]] std::vector<RuleMatch>
per_feature(const EvidenceBundle& bundle, FeatureKind kind, std::string_view prefix)
{
    std::vector<RuleMatch> matches;
    for (const auto& feature : bundle.source_features()) {
        if (feature.kind != kind) {
            continue;
        }
        matches.push_back(RuleMatch{.text = std::string(prefix) + " in " + describe_lines(feature),
                                    .refs = feature_refs(feature)});
    }
    return matches;
}

[[nodiscard]] std::vector<RuleMatch> alloc_sizing_unguarded(const EvidenceBundle& bundle)
{
    std::vector<RuleMatch> matches;
    for (const auto& feature : bundle.source_features()) {
        if (feature.kind != FeatureKind::kAllocationSizing || feature.guarded
            || paired_bounds_check(bundle, feature) != nullptr) {
            continue;
        }
        matches.push_back(RuleMatch{.text = "Allocation size arithmetic " + side_word(feature)
                                            + " without a bounds or overflow check in " + describe_lines(feature),
                                    .refs = feature_refs(feature)});
    }
    return matches;
}

[[nodiscard]] std::vector<RuleMatch> alloc_sizing_guarded(const EvidenceBundle& bundle)
{
    std::vector<RuleMatch> matches;
    for (const auto& feature : bundle.source_features()) {
        if (feature.kind != FeatureKind::kAllocationSizing) {
            continue;
        }
        const SourceFeature* bounds = paired_bounds_check(bundle, feature);
        if (!feature.guarded && bounds == nullptr) {
            continue;
        }
        auto refs = feature_refs(feature);
        if (bounds != nullptr) {
            refs.push_back(local_ref(RefType::kSourceFeature, bounds->feature_id));
        }
        matches.push_back(RuleMatch{.text = "Guarded allocation size arithmetic " + side_word(feature) + " in "
                                            + describe_lines(feature),
                                    .refs = std::move(refs)});
    }
    return matches;
}

[[nodiscard]] const evidence::BinaryString* find_string(const evidence::BinaryFeatureSet& set,
                                                        std::string_view string_id)
{
    auto it = std::ranges::find_if(set.strings, [string_id](const auto& s) { return s.string_id == string_id; });
    return it == set.strings.end() ? nullptr : &*it;
}

/// First hunk with a changed line containing text, or nullptr
[[nodiscard]] const evidence::DiffHunk* hunk_mentioning(const EvidenceBundle& bundle, std::string_view text)
{
    for (const auto& hunk : bundle.diff_hunks()) {
        for (const auto& line : hunk.lines) {
            if ((line.starts_with('+') || line.starts_with('-')) && line.find(text, 1) != std::string::npos) {
                return &hunk;
            }
        }
    }
    return nullptr;
}

[[nodiscard]] std::vector<RuleMatch> log_binary_changed_region(const EvidenceBundle& bundle)
{
    const auto& from = bundle.binary_features_from();
    const auto& to = bundle.binary_features_to();
    const bool from_usable = from && from->status == evidence::ExtractionStatus::kOk;
    std::set<std::string_view> from_values;
    if (from_usable) {
        for (const auto& s : from->strings) {
            from_values.insert(s.value);
        }
    }

    std::vector<RuleMatch> matches;
    for (const auto& match : bundle.log_to_binary_matches()) {
        const bool in_to = to && to->artifact_id == match.artifact_id;
        const bool new_in_to = in_to && from_usable && !from_values.contains(match.matched_string);
        const evidence::DiffHunk* hunk = hunk_mentioning(bundle, match.matched_string);
        if (!new_in_to && hunk == nullptr) {
            continue;
        }

        std::vector<EvidenceRef> refs = {
            local_ref(RefType::kLogTemplate, match.template_id),
            binary_ref(RefType::kBinaryString, match.artifact_id, match.string_id),
            local_ref(RefType::kLogBinaryMatch, match.match_id),
        };
        std::string text = "Log message string \"" + match.matched_string + "\"";
        if (new_in_to) {
            text += " is new in " + match.artifact_id;
        }
        if (hunk != nullptr) {
            text += new_in_to ? " and" : "";
            text += " appears in changed code in " + hunk->file_path;
            refs.push_back(local_ref(RefType::kDiffHunk, hunk->hunk_id));
        }
        matches.push_back(RuleMatch{.text = std::move(text), .refs = std::move(refs)});
    }
    return matches;
}

[[nodiscard]] std::vector<RuleMatch> unmatched_symbol_with_source_change(const EvidenceBundle& bundle)
{
    std::vector<RuleMatch> matches;
    if (bundle.diff_hunks().empty()) {
        return matches;
    }
    for (const auto& pair : bundle.binary_diff_pairs()) {
        if (pair.basis != evidence::MatchBasis::kNone) {
            continue;
        }
        std::vector<EvidenceRef> refs = {local_ref(RefType::kBinaryDiffPair, pair.pair_id)};
        std::string text;
        if (pair.from_symbol_id && bundle.binary_features_from()) {
            refs.push_back(binary_ref(RefType::kBinarySymbol,
                                      bundle.binary_features_from()->artifact_id,
                                      *pair.from_symbol_id));
            text = "Symbol " + pair.name + " disappeared in " + bundle.build_to();
        } else if (pair.to_symbol_id && bundle.binary_features_to()) {
            refs.push_back(
                binary_ref(RefType::kBinarySymbol, bundle.binary_features_to()->artifact_id, *pair.to_symbol_id));
            text = "Symbol " + pair.name + " appeared in " + bundle.build_to();
        }
        matches.push_back(RuleMatch{.text = text + " while the source changed", .refs = std::move(refs)});
    }
    return matches;
}

[[nodiscard]] std::vector<RuleMatch> import_added(const EvidenceBundle& bundle)
{
    std::vector<RuleMatch> matches;
    const auto& from = bundle.binary_features_from();
    const auto& to = bundle.binary_features_to();
    if (!from || !to || from->status != evidence::ExtractionStatus::kOk
        || to->status != evidence::ExtractionStatus::kOk) {
        return matches;
    }
    std::set<std::string_view> before;
    for (const auto& imp : from->imports) {
        before.insert(imp.name);
    }
    for (const auto& imp : to->imports) {
        if (before.contains(imp.name)) {
            continue;
        }
        matches.push_back(RuleMatch{.text = "Import " + imp.name + " added in " + bundle.build_to(),
                                    .refs = {binary_ref(RefType::kBinaryImport, to->artifact_id, imp.import_id)}});
    }
    return matches;
}

[[nodiscard]] std::vector<RuleDefinition> make_ruleset()
{
    return {
        {"alloc-sizing-unguarded",
         "allocation-sizing feature with no bounds-check feature in the same hunk", 3.0,
         alloc_sizing_unguarded},
        {"alloc-sizing-guarded",
         "allocation-sizing feature with a bounds-check feature in the same hunk", 1.5,
         alloc_sizing_guarded},
        {"bounds-check-removed", "bounds-check-removed feature", 2.5,
         [](const EvidenceBundle& b) {
             return per_feature(b, FeatureKind::kBoundsCheckRemoved, "Bounds check removed");
         }},
        {"bounds-check-added", "bounds-check-added feature", 1.0,
         [](const EvidenceBundle& b) {
             return per_feature(b, FeatureKind::kBoundsCheckAdded, "Bounds check added");
         }},
        {"parsing-logic-changed", "parsing-logic feature", 2.0,
         [](const EvidenceBundle& b) {
             return per_feature(b, FeatureKind::kParsingLogic, "Length/count parsing logic changed");
         }},
        {"privilege-check-removed", "privilege-check-removed feature", 2.5,
         [](const EvidenceBundle& b) {
             return per_feature(b, FeatureKind::kPrivilegeCheckRemoved, "Privilege check removed");
         }},
        {"privilege-check-added", "privilege-check-added feature", 1.5,
         [](const EvidenceBundle& b) {
             return per_feature(b, FeatureKind::kPrivilegeCheckAdded, "Privilege check added");
         }},
        {"log-binary-changed-region",
         "log-to-binary match whose string is new in the to binary or appears in a changed hunk line", 1.2,
         log_binary_changed_region},
        {"unmatched-symbol-with-source-change",
         "unmatched binary diff pair in a bundle with at least one hunk", 0.5,
         unmatched_symbol_with_source_change},
        {"import-added", "import present in to but not in from", 0.3, import_added},
    };
}

}  // namespace

const std::vector<RuleDefinition>& ruleset()
{
    static const std::vector<RuleDefinition> kRules = make_ruleset();
    return kRules;
}

const RuleDefinition* find_rule(std::string_view rule_id)
{
    const auto& rules = ruleset();
    auto it = std::ranges::find_if(rules, [rule_id](const auto& rule) { return rule.rule_id == rule_id; });
    return it == rules.end() ? nullptr : &*it;
}

}  // namespace ossensor::scoring
