#pragma once

/**
 * @file bundle.hpp
 * @brief EvidenceBundleAssembler and the immutable EvidenceBundle it produces
 *
 * A bundle can only be obtained through EvidenceBundleAssembler::assemble
 * (or bundle_from_json, which goes through it), so every bundle in memory
 * has passed structural validation: ids are unique per kind and every id
 * referenced inside the bundle resolves inside the bundle.
 */

#include "ossensor/common.hpp"
#include "ossensor/evidence.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

namespace ossensor::bundle {

/// Everything one diff run produced, before validation
struct BundleInputs
{
    std::string build_from;
    std::string build_to;
    std::string component;
    std::vector<evidence::DiffHunk> diff_hunks;
    std::vector<evidence::SourceFeature> source_features;
    std::vector<evidence::SkipNotice> source_skips;
    std::vector<std::string> log_notices;
    std::optional<evidence::BinaryFeatureSet> binary_features_from;
    std::optional<evidence::BinaryFeatureSet> binary_features_to;
    std::vector<evidence::BinaryDiffPair> binary_diff_pairs;
    std::vector<evidence::LogTemplate> log_templates;
    std::vector<evidence::LogToBinaryMatch> log_to_binary_matches;
};

class EvidenceBundle
{
public:
    [[nodiscard]] const std::string& diff_id() const { return m_diff_id; }
    [[nodiscard]] const std::string& build_from() const { return m_contents.build_from; }
    [[nodiscard]] const std::string& build_to() const { return m_contents.build_to; }
    [[nodiscard]] const std::string& component() const { return m_contents.component; }

    [[nodiscard]] const std::vector<evidence::DiffHunk>& diff_hunks() const
    {
        return m_contents.diff_hunks;
    }
    [[nodiscard]] const std::vector<evidence::SourceFeature>& source_features() const
    {
        return m_contents.source_features;
    }
    [[nodiscard]] const std::vector<evidence::SkipNotice>& source_skips() const
    {
        return m_contents.source_skips;
    }
    [[nodiscard]] const std::vector<std::string>& log_notices() const { return m_contents.log_notices; }
    [[nodiscard]] const std::optional<evidence::BinaryFeatureSet>& binary_features_from() const
    {
        return m_contents.binary_features_from;
    }
    [[nodiscard]] const std::optional<evidence::BinaryFeatureSet>& binary_features_to() const
    {
        return m_contents.binary_features_to;
    }
    [[nodiscard]] const std::vector<evidence::BinaryDiffPair>& binary_diff_pairs() const
    {
        return m_contents.binary_diff_pairs;
    }
    [[nodiscard]] const std::vector<evidence::LogTemplate>& log_templates() const
    {
        return m_contents.log_templates;
    }
    [[nodiscard]] const std::vector<evidence::LogToBinaryMatch>& log_to_binary_matches() const
    {
        return m_contents.log_to_binary_matches;
    }

    /// Lookups by stable id; nullptr when absent
    [[nodiscard]] const evidence::DiffHunk* find_hunk(std::string_view hunk_id) const;
    [[nodiscard]] const evidence::SourceFeature* find_feature(std::string_view feature_id) const;
    [[nodiscard]] const evidence::LogTemplate* find_template(std::string_view template_id) const;
    [[nodiscard]] const evidence::BinaryFeatureSet* find_feature_set(std::string_view artifact_id) const;

    /**
     * True when ref points at an entity of its type inside this bundle.
     * A binary ref without artifact_id resolves against either side.
     */
    [[nodiscard]] bool resolves(const evidence::EvidenceRef& ref) const;

    /**
     * @return DanglingReference naming the first ref that does not resolve
     */
    [[nodiscard]] ossensor::VoidResult validate_refs(std::span<const evidence::EvidenceRef> refs) const;

    /// Bundle document including schema_version and diff_id
    [[nodiscard]] nlohmann::json to_json() const;

private:
    friend class EvidenceBundleAssembler;

    EvidenceBundle(BundleInputs contents, std::string diff_id);

    void build_index();

    BundleInputs m_contents;
    std::string m_diff_id;
    /// (ref_type, artifact_id or "", stable_id) of every addressable entity
    std::set<std::tuple<evidence::RefType, std::string, std::string>> m_index;
    std::map<std::string, std::size_t, std::less<>> m_hunk_pos;
    std::map<std::string, std::size_t, std::less<>> m_feature_pos;
    std::map<std::string, std::size_t, std::less<>> m_template_pos;
};

/**
 * Pure aggregation: ordering normalization plus structural validation.
 */
class EvidenceBundleAssembler
{
public:
    /**
     * Normalize and validate the inputs into a bundle.
     *
     * @return DuplicateStableId, DanglingReference or InconsistentBundle on
     *         a structural violation; the bundle is never partially built
     */
    [[nodiscard]] ossensor::Result<EvidenceBundle> assemble(BundleInputs inputs) const;
};

/**
 * Rebuild a bundle from its JSON document. The document goes through the
 * same validation as assemble(), and its stored diff_id must match the
 * recomputed one.
 */
[[nodiscard]] ossensor::Result<EvidenceBundle> bundle_from_json(const nlohmann::json& j);

/**
 * Read a bundle file, validate it against the evidence_bundle schema in
 * schema_dir, then rebuild it with bundle_from_json.
 */
[[nodiscard]] ossensor::Result<EvidenceBundle> read_bundle_file(const std::filesystem::path& path,
                                                                const std::filesystem::path& schema_dir);

}  // namespace ossensor::bundle
