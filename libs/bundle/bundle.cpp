/**
 * @file bundle.cpp
 * @brief Evidence bundle assembly, validation and JSON round-trip
 */

#include "ossensor/bundle.hpp"

#include "ossensor/canonical_json.hpp"
#include "ossensor/schema_validate.hpp"
#include "ossensor/version.hpp"

#include <algorithm>
#include <string_view>

#include <spdlog/spdlog.h>

namespace ossensor::bundle {

namespace {

using evidence::BinaryFeatureSet;
using evidence::EvidenceRef;
using evidence::RefType;

constexpr std::string_view kDiffIdPrefix = "diff:";

[[nodiscard]] Error inconsistent(std::string message)
{
    return Error::make("InconsistentBundle", std::move(message));
}

[[nodiscard]] Error dangling(std::string message)
{
    return Error::make("DanglingReference", std::move(message));
}

[[nodiscard]] bool is_artifact_scoped(RefType type)
{
    return type == RefType::kBinaryString || type == RefType::kBinaryImport
           || type == RefType::kBinarySymbol;
}

template <typename T, typename IdFn>
[[nodiscard]] ossensor::VoidResult check_unique(const std::vector<T>& items, IdFn id_of, std::string_view what)
{
    std::set<std::string_view> seen;
    for (const auto& item : items) {
        const std::string& id = id_of(item);
        if (id.empty()) {
            return std::unexpected(inconsistent("Empty " + std::string(what) + " id"));
        }
        if (!seen.insert(id).second) {
            return std::unexpected(
                Error::make("DuplicateStableId", "Duplicate " + std::string(what) + " id: " + id));
        }
    }
    return {};
}

[[nodiscard]] ossensor::VoidResult check_feature_set(const BinaryFeatureSet& set,
                                                     const std::string& expected_build,
                                                     const std::string& component,
                                                     std::string_view side)
{
    const std::string where = "binary_features_" + std::string(side);
    if (set.build_id != expected_build || set.component != component) {
        return std::unexpected(inconsistent(where + " is labeled " + set.build_id + "/" + set.component
                                            + ", expected " + expected_build + "/" + component));
    }
    if (set.artifact_id != evidence::make_artifact_id(set.build_id, set.component)) {
        return std::unexpected(inconsistent(where + " has artifact id " + set.artifact_id));
    }
    if (set.status != evidence::ExtractionStatus::kOk) {
        if (!set.strings.empty() || !set.imports.empty() || !set.symbols.empty()
            || !set.objc_metadata_stub.empty()) {
            return std::unexpected(
                inconsistent(where + " has status " + std::string(to_string(set.status))
                             + " but carries features"));
        }
        if (set.notices.empty()) {
            return std::unexpected(
                inconsistent(where + " has status " + std::string(to_string(set.status)) + " but no notice"));
        }
    }
    if (auto r = check_unique(set.strings, [](const auto& s) -> const std::string& { return s.string_id; }, "string");
        !r) {
        return r;
    }
    if (auto r = check_unique(set.imports, [](const auto& i) -> const std::string& { return i.import_id; }, "import");
        !r) {
        return r;
    }
    return check_unique(set.symbols, [](const auto& s) -> const std::string& { return s.symbol_id; }, "symbol");
}

/// Hunks of one file must not overlap on either side
[[nodiscard]] ossensor::VoidResult check_hunk_coverage(const std::vector<evidence::DiffHunk>& hunks)
{
    for (std::size_t i = 1; i < hunks.size(); ++i) {
        const auto& prev = hunks[i - 1];
        const auto& next = hunks[i];
        if (prev.file_path != next.file_path) {
            continue;
        }
        const bool old_overlap = prev.old_count > 0 && next.old_count > 0
                                 && prev.old_start + prev.old_count > next.old_start;
        const bool new_overlap = prev.new_count > 0 && next.new_count > 0
                                 && prev.new_start + prev.new_count > next.new_start;
        if (old_overlap || new_overlap) {
            return std::unexpected(
                inconsistent("Overlapping hunks in " + next.file_path + ": " + prev.hunk_id + ", " + next.hunk_id));
        }
    }
    return {};
}

[[nodiscard]] bool has_symbol(const BinaryFeatureSet& set, std::string_view symbol_id)
{
    return std::ranges::any_of(set.symbols, [symbol_id](const auto& s) { return s.symbol_id == symbol_id; });
}

[[nodiscard]] ossensor::VoidResult validate(const BundleInputs& in)
{
    if (in.build_from.empty() || in.build_to.empty() || in.component.empty()) {
        return std::unexpected(inconsistent("Bundle labels build_from, build_to and component must be non-empty"));
    }
    if (in.binary_features_from && in.binary_features_to && in.build_from == in.build_to) {
        return std::unexpected(inconsistent("Both binaries belong to build " + in.build_from));
    }

    // Hunks and features
    if (auto r = check_unique(in.diff_hunks, [](const auto& h) -> const std::string& { return h.hunk_id; }, "hunk");
        !r) {
        return r;
    }
    if (auto r = check_hunk_coverage(in.diff_hunks); !r) {
        return r;
    }
    std::map<std::string_view, const evidence::DiffHunk*> hunks;
    for (const auto& hunk : in.diff_hunks) {
        hunks.emplace(hunk.hunk_id, &hunk);
    }
    if (auto r = check_unique(in.source_features,
                              [](const auto& f) -> const std::string& { return f.feature_id; },
                              "feature");
        !r) {
        return r;
    }
    for (const auto& feature : in.source_features) {
        if (feature.hunk_ids.empty()) {
            return std::unexpected(inconsistent("Feature " + feature.feature_id + " cites no hunk"));
        }
        for (const auto& hunk_id : feature.hunk_ids) {
            auto it = hunks.find(hunk_id);
            if (it == hunks.end()) {
                return std::unexpected(
                    dangling("Feature " + feature.feature_id + " cites unknown hunk " + hunk_id));
            }
            if (it->second->file_path != feature.file_path) {
                return std::unexpected(inconsistent("Feature " + feature.feature_id + " is in "
                                                    + feature.file_path + " but its hunk is in "
                                                    + it->second->file_path));
            }
        }
    }

    // Binary feature sets and pairs
    if (in.binary_features_from) {
        if (auto r = check_feature_set(*in.binary_features_from, in.build_from, in.component, "from"); !r) {
            return r;
        }
    }
    if (in.binary_features_to) {
        if (auto r = check_feature_set(*in.binary_features_to, in.build_to, in.component, "to"); !r) {
            return r;
        }
    }
    if (auto r = check_unique(in.binary_diff_pairs,
                              [](const auto& p) -> const std::string& { return p.pair_id; },
                              "binary diff pair");
        !r) {
        return r;
    }
    for (const auto& pair : in.binary_diff_pairs) {
        if (!pair.from_symbol_id && !pair.to_symbol_id) {
            return std::unexpected(inconsistent("Binary diff pair " + pair.pair_id + " has no symbol"));
        }
        if (pair.from_symbol_id
            && (!in.binary_features_from || !has_symbol(*in.binary_features_from, *pair.from_symbol_id))) {
            return std::unexpected(
                dangling("Binary diff pair " + pair.pair_id + " cites unknown from symbol " + *pair.from_symbol_id));
        }
        if (pair.to_symbol_id
            && (!in.binary_features_to || !has_symbol(*in.binary_features_to, *pair.to_symbol_id))) {
            return std::unexpected(
                dangling("Binary diff pair " + pair.pair_id + " cites unknown to symbol " + *pair.to_symbol_id));
        }
    }

    // Logs
    if (auto r = check_unique(in.log_templates,
                              [](const auto& t) -> const std::string& { return t.template_id; },
                              "log template");
        !r) {
        return r;
    }
    if (auto r = check_unique(in.log_to_binary_matches,
                              [](const auto& m) -> const std::string& { return m.match_id; },
                              "log match");
        !r) {
        return r;
    }
    for (const auto& match : in.log_to_binary_matches) {
        const bool known_template = std::ranges::any_of(
            in.log_templates, [&match](const auto& t) { return t.template_id == match.template_id; });
        if (!known_template) {
            return std::unexpected(
                dangling("Log match " + match.match_id + " cites unknown template " + match.template_id));
        }
        const BinaryFeatureSet* set = nullptr;
        if (in.binary_features_from && in.binary_features_from->artifact_id == match.artifact_id) {
            set = &*in.binary_features_from;
        } else if (in.binary_features_to && in.binary_features_to->artifact_id == match.artifact_id) {
            set = &*in.binary_features_to;
        }
        if (set == nullptr) {
            return std::unexpected(
                dangling("Log match " + match.match_id + " cites unknown artifact " + match.artifact_id));
        }
        auto str = std::ranges::find_if(set->strings,
                                        [&match](const auto& s) { return s.string_id == match.string_id; });
        if (str == set->strings.end()) {
            return std::unexpected(
                dangling("Log match " + match.match_id + " cites unknown string " + match.string_id));
        }
        if (str->value != match.matched_string) {
            return std::unexpected(
                inconsistent("Log match " + match.match_id + " text differs from string " + match.string_id));
        }
    }
    return {};
}

/// Bundle document without diff_id; diff_id is derived from it
[[nodiscard]] nlohmann::json content_json(const BundleInputs& in)
{
    nlohmann::json j = {
        {       "schema_version",       kBundleSchemaVersion},
        {           "build_from",              in.build_from},
        {             "build_to",                in.build_to},
        {            "component",               in.component},
        {           "diff_hunks",              in.diff_hunks},
        {      "source_features",         in.source_features},
        {         "source_skips",            in.source_skips},
        {          "log_notices",             in.log_notices},
        {    "binary_diff_pairs",       in.binary_diff_pairs},
        {        "log_templates",           in.log_templates},
        {"log_to_binary_matches", in.log_to_binary_matches}
    };
    if (in.binary_features_from) {
        j["binary_features_from"] = *in.binary_features_from;
    }
    if (in.binary_features_to) {
        j["binary_features_to"] = *in.binary_features_to;
    }
    return j;
}

[[nodiscard]] ossensor::Result<std::string> compute_diff_id(const nlohmann::json& content)
{
    auto canonical = canonical::canonicalize(content);
    if (!canonical) {
        return std::unexpected(canonical.error());
    }
    return std::string(kDiffIdPrefix) + common::sha256(*canonical).substr(0, common::kStableDigestLength);
}

template <typename T, typename Reader>
[[nodiscard]] ossensor::Result<std::vector<T>> read_array(const nlohmann::json& j, const char* key, Reader reader)
{
    std::vector<T> items;
    auto it = j.find(key);
    if (it == j.end()) {
        return std::unexpected(Error::make("ParseError", std::string("Bundle is missing ") + key));
    }
    if (!it->is_array()) {
        return std::unexpected(Error::make("ParseError", std::string("Bundle field ") + key + " is not an array"));
    }
    items.reserve(it->size());
    for (const auto& element : *it) {
        auto item = reader(element);
        if (!item) {
            return std::unexpected(item.error());
        }
        items.push_back(std::move(*item));
    }
    return items;
}

[[nodiscard]] ossensor::Result<std::optional<BinaryFeatureSet>> read_optional_set(const nlohmann::json& j,
                                                                                  const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::optional<BinaryFeatureSet>{};
    }
    auto set = evidence::feature_set_from_json(*it);
    if (!set) {
        return std::unexpected(set.error());
    }
    return std::optional<BinaryFeatureSet>(std::move(*set));
}

[[nodiscard]] ossensor::Result<std::string> read_string(const nlohmann::json& j, const char* key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::unexpected(Error::make("ParseError", std::string("Bundle field ") + key + " must be a string"));
    }
    return it->get<std::string>();
}

}  // namespace

// ============================================================================
// EvidenceBundle
// ============================================================================

EvidenceBundle::EvidenceBundle(BundleInputs contents, std::string diff_id)
    : m_contents(std::move(contents))
    , m_diff_id(std::move(diff_id))
{
    build_index();
}

void EvidenceBundle::build_index()
{
    for (std::size_t i = 0; i < m_contents.diff_hunks.size(); ++i) {
        const auto& id = m_contents.diff_hunks[i].hunk_id;
        m_hunk_pos.emplace(id, i);
        m_index.emplace(RefType::kDiffHunk, std::string{}, id);
    }
    for (std::size_t i = 0; i < m_contents.source_features.size(); ++i) {
        const auto& id = m_contents.source_features[i].feature_id;
        m_feature_pos.emplace(id, i);
        m_index.emplace(RefType::kSourceFeature, std::string{}, id);
    }
    for (const auto* set : {&m_contents.binary_features_from, &m_contents.binary_features_to}) {
        if (!set->has_value()) {
            continue;
        }
        const auto& artifact = (*set)->artifact_id;
        for (const auto& s : (*set)->strings) {
            m_index.emplace(RefType::kBinaryString, artifact, s.string_id);
        }
        for (const auto& imp : (*set)->imports) {
            m_index.emplace(RefType::kBinaryImport, artifact, imp.import_id);
        }
        for (const auto& sym : (*set)->symbols) {
            m_index.emplace(RefType::kBinarySymbol, artifact, sym.symbol_id);
        }
    }
    for (const auto& pair : m_contents.binary_diff_pairs) {
        m_index.emplace(RefType::kBinaryDiffPair, std::string{}, pair.pair_id);
    }
    for (std::size_t i = 0; i < m_contents.log_templates.size(); ++i) {
        const auto& id = m_contents.log_templates[i].template_id;
        m_template_pos.emplace(id, i);
        m_index.emplace(RefType::kLogTemplate, std::string{}, id);
    }
    for (const auto& match : m_contents.log_to_binary_matches) {
        m_index.emplace(RefType::kLogBinaryMatch, std::string{}, match.match_id);
    }
}

const evidence::DiffHunk* EvidenceBundle::find_hunk(std::string_view hunk_id) const
{
    auto it = m_hunk_pos.find(hunk_id);
    return it == m_hunk_pos.end() ? nullptr : &m_contents.diff_hunks[it->second];
}

const evidence::SourceFeature* EvidenceBundle::find_feature(std::string_view feature_id) const
{
    auto it = m_feature_pos.find(feature_id);
    return it == m_feature_pos.end() ? nullptr : &m_contents.source_features[it->second];
}

const evidence::LogTemplate* EvidenceBundle::find_template(std::string_view template_id) const
{
    auto it = m_template_pos.find(template_id);
    return it == m_template_pos.end() ? nullptr : &m_contents.log_templates[it->second];
}

const BinaryFeatureSet* EvidenceBundle::find_feature_set(std::string_view artifact_id) const
{
    for (const auto* set : {&m_contents.binary_features_from, &m_contents.binary_features_to}) {
        if (set->has_value() && (*set)->artifact_id == artifact_id) {
            return &**set;
        }
    }
    return nullptr;
}

bool EvidenceBundle::resolves(const EvidenceRef& ref) const
{
    if (!is_artifact_scoped(ref.type)) {
        return !ref.artifact_id && m_index.contains({ref.type, std::string{}, ref.stable_id});
    }
    if (ref.artifact_id) {
        return m_index.contains({ref.type, *ref.artifact_id, ref.stable_id});
    }
    for (const auto* set : {&m_contents.binary_features_from, &m_contents.binary_features_to}) {
        if (set->has_value() && m_index.contains({ref.type, (*set)->artifact_id, ref.stable_id})) {
            return true;
        }
    }
    return false;
}

ossensor::VoidResult EvidenceBundle::validate_refs(std::span<const EvidenceRef> refs) const
{
    for (const auto& ref : refs) {
        if (!resolves(ref)) {
            std::string message = "Evidence ref " + std::string(to_string(ref.type)) + " " + ref.stable_id;
            if (ref.artifact_id) {
                message += " in " + *ref.artifact_id;
            }
            return std::unexpected(dangling(message + " does not resolve in bundle " + m_diff_id));
        }
    }
    return {};
}

nlohmann::json EvidenceBundle::to_json() const
{
    nlohmann::json j = content_json(m_contents);
    j["diff_id"] = m_diff_id;
    return j;
}

// ============================================================================
// Assembly
// ============================================================================

ossensor::Result<EvidenceBundle> EvidenceBundleAssembler::assemble(BundleInputs inputs) const
{
    std::ranges::stable_sort(inputs.diff_hunks, [](const auto& a, const auto& b) {
        return std::tie(a.file_path, a.old_start, a.new_start) < std::tie(b.file_path, b.old_start, b.new_start);
    });

    if (auto valid = validate(inputs); !valid) {
        spdlog::error("bundle assembly failed: {}", valid.error().message);
        return std::unexpected(valid.error());
    }

    auto diff_id = compute_diff_id(content_json(inputs));
    if (!diff_id) {
        return std::unexpected(diff_id.error());
    }
    spdlog::debug("assembled bundle {}: {} hunks, {} features, {} templates, {} log matches",
                  *diff_id,
                  inputs.diff_hunks.size(),
                  inputs.source_features.size(),
                  inputs.log_templates.size(),
                  inputs.log_to_binary_matches.size());
    return EvidenceBundle(std::move(inputs), std::move(*diff_id));
}

ossensor::Result<EvidenceBundle> bundle_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(Error::make("ParseError", "Bundle document must be an object"));
    }
    auto schema_version = read_string(j, "schema_version");
    if (!schema_version) {
        return std::unexpected(schema_version.error());
    }
    if (*schema_version != kBundleSchemaVersion) {
        return std::unexpected(
            Error::make("ParseError", "Unsupported bundle schema_version: " + *schema_version));
    }

    BundleInputs inputs;
    auto build_from = read_string(j, "build_from");
    auto build_to = read_string(j, "build_to");
    auto component = read_string(j, "component");
    auto stored_id = read_string(j, "diff_id");
    for (const auto* field : {&build_from, &build_to, &component, &stored_id}) {
        if (!*field) {
            return std::unexpected(field->error());
        }
    }
    inputs.build_from = *build_from;
    inputs.build_to = *build_to;
    inputs.component = *component;

    auto hunks = read_array<evidence::DiffHunk>(j, "diff_hunks", evidence::hunk_from_json);
    if (!hunks) {
        return std::unexpected(hunks.error());
    }
    inputs.diff_hunks = std::move(*hunks);

    auto features = read_array<evidence::SourceFeature>(j, "source_features", evidence::feature_from_json);
    if (!features) {
        return std::unexpected(features.error());
    }
    inputs.source_features = std::move(*features);

    auto skips = read_array<evidence::SkipNotice>(j, "source_skips", evidence::skip_from_json);
    if (!skips) {
        return std::unexpected(skips.error());
    }
    inputs.source_skips = std::move(*skips);

    auto notices = read_array<std::string>(j, "log_notices", [](const nlohmann::json& e) -> ossensor::Result<std::string> {
        if (!e.is_string()) {
            return std::unexpected(Error::make("ParseError", "log_notices entries must be strings"));
        }
        return e.get<std::string>();
    });
    if (!notices) {
        return std::unexpected(notices.error());
    }
    inputs.log_notices = std::move(*notices);

    auto from_set = read_optional_set(j, "binary_features_from");
    if (!from_set) {
        return std::unexpected(from_set.error());
    }
    inputs.binary_features_from = std::move(*from_set);
    auto to_set = read_optional_set(j, "binary_features_to");
    if (!to_set) {
        return std::unexpected(to_set.error());
    }
    inputs.binary_features_to = std::move(*to_set);

    auto pairs = read_array<evidence::BinaryDiffPair>(j, "binary_diff_pairs", evidence::pair_from_json);
    if (!pairs) {
        return std::unexpected(pairs.error());
    }
    inputs.binary_diff_pairs = std::move(*pairs);

    auto templates = read_array<evidence::LogTemplate>(j, "log_templates", evidence::template_from_json);
    if (!templates) {
        return std::unexpected(templates.error());
    }
    inputs.log_templates = std::move(*templates);

    auto matches = read_array<evidence::LogToBinaryMatch>(j, "log_to_binary_matches", evidence::match_from_json);
    if (!matches) {
        return std::unexpected(matches.error());
    }
    inputs.log_to_binary_matches = std::move(*matches);

    auto bundle = EvidenceBundleAssembler{}.assemble(std::move(inputs));
    if (!bundle) {
        return std::unexpected(bundle.error());
    }
    if (bundle->diff_id() != *stored_id) {
        return std::unexpected(inconsistent("Bundle diff_id mismatch: stored " + *stored_id + ", computed "
                                            + bundle->diff_id()));
    }
    return bundle;
}

ossensor::Result<EvidenceBundle> read_bundle_file(const std::filesystem::path& path,
                                                  const std::filesystem::path& schema_dir)
{
    auto doc = common::read_json_file(path);
    if (!doc) {
        return std::unexpected(doc.error());
    }
    if (auto valid = common::validate_json_version(*doc, schema_dir, kBundleSchemaVersion); !valid) {
        return std::unexpected(valid.error());
    }
    return bundle_from_json(*doc);
}

}  // namespace ossensor::bundle
