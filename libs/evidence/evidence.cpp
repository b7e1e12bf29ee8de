/**
 * @file evidence.cpp
 * @brief Stable id construction and JSON mapping for the evidence model
 */

#include "ossensor/evidence.hpp"

#include "ossensor/common.hpp"

#include <array>
#include <string>
#include <utility>

namespace ossensor::evidence {

namespace {

template <typename Enum, std::size_t N>
[[nodiscard]] std::string_view enum_name(const std::array<std::pair<Enum, std::string_view>, N>& table,
                                         Enum value)
{
    for (const auto& [candidate, name] : table) {
        if (candidate == value) {
            return name;
        }
    }
    return "unknown";
}

template <typename Enum, std::size_t N>
[[nodiscard]] ossensor::Result<Enum>
enum_value(const std::array<std::pair<Enum, std::string_view>, N>& table,
           std::string_view text,
           std::string_view what)
{
    for (const auto& [candidate, name] : table) {
        if (name == text) {
            return candidate;
        }
    }
    return std::unexpected(Error::make(
        "ParseError", "Unknown " + std::string(what) + ": '" + std::string(text) + "'"));
}

constexpr std::array<std::pair<RefType, std::string_view>, 8> kRefTypeNames = {{
    {        RefType::kDiffHunk,        "diff_hunk"},
    {   RefType::kSourceFeature,   "source_feature"},
    {    RefType::kBinaryString,    "binary_string"},
    {    RefType::kBinaryImport,    "binary_import"},
    {    RefType::kBinarySymbol,    "binary_symbol"},
    {  RefType::kBinaryDiffPair, "binary_diff_pair"},
    {     RefType::kLogTemplate,     "log_template"},
    {  RefType::kLogBinaryMatch, "log_binary_match"},
}};

constexpr std::array<std::pair<FeatureKind, std::string_view>, 6> kFeatureKindNames = {{
    {     FeatureKind::kAllocationSizing,       "allocation-sizing"},
    {     FeatureKind::kBoundsCheckAdded,      "bounds-check-added"},
    {   FeatureKind::kBoundsCheckRemoved,    "bounds-check-removed"},
    {         FeatureKind::kParsingLogic,           "parsing-logic"},
    {  FeatureKind::kPrivilegeCheckAdded,   "privilege-check-added"},
    {FeatureKind::kPrivilegeCheckRemoved, "privilege-check-removed"},
}};

constexpr std::array<std::pair<ChangeSide, std::string_view>, 2> kChangeSideNames = {{
    {  ChangeSide::kAdded,   "added"},
    {ChangeSide::kRemoved, "removed"},
}};

constexpr std::array<std::pair<BinaryFormat, std::string_view>, 4> kBinaryFormatNames = {{
    { BinaryFormat::kUnknown,   "unknown"},
    {     BinaryFormat::kElf,       "elf"},
    {   BinaryFormat::kMachO,     "macho"},
    {BinaryFormat::kMachOFat, "macho-fat"},
}};

constexpr std::array<std::pair<ExtractionStatus, std::string_view>, 5> kStatusNames = {{
    {         ExtractionStatus::kOk,          "ok"},
    {  ExtractionStatus::kTruncated,   "truncated"},
    {  ExtractionStatus::kMalformed,   "malformed"},
    {ExtractionStatus::kUnsupported, "unsupported"},
    { ExtractionStatus::kUnreadable,  "unreadable"},
}};

constexpr std::array<std::pair<MatchBasis, std::string_view>, 3> kMatchBasisNames = {{
    {   MatchBasis::kName,    "name"},
    {MatchBasis::kAddress, "address"},
    {   MatchBasis::kNone,    "none"},
}};

/// Run a reader that uses throwing nlohmann accessors, mapping failures to ParseError.
template <typename T, typename Fn>
[[nodiscard]] ossensor::Result<T> guarded_read(std::string_view what, Fn&& fn)
{
    try {
        return fn();
    } catch (const nlohmann::json::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", "Invalid " + std::string(what) + ": " + ex.what()));
    }
}

template <typename T>
[[nodiscard]] std::optional<T> optional_field(const nlohmann::json& j, const char* key)
{
    if (auto it = j.find(key); it != j.end() && !it->is_null()) {
        return it->get<T>();
    }
    return std::nullopt;
}

}  // namespace

// ============================================================================
// Enum spellings
// ============================================================================

std::string_view to_string(RefType type)
{
    return enum_name(kRefTypeNames, type);
}

ossensor::Result<RefType> ref_type_from_string(std::string_view text)
{
    return enum_value(kRefTypeNames, text, "ref_type");
}

std::string_view to_string(FeatureKind kind)
{
    return enum_name(kFeatureKindNames, kind);
}

ossensor::Result<FeatureKind> feature_kind_from_string(std::string_view text)
{
    return enum_value(kFeatureKindNames, text, "feature kind");
}

std::string_view to_string(ChangeSide side)
{
    return enum_name(kChangeSideNames, side);
}

ossensor::Result<ChangeSide> change_side_from_string(std::string_view text)
{
    return enum_value(kChangeSideNames, text, "change side");
}

std::string_view to_string(BinaryFormat format)
{
    return enum_name(kBinaryFormatNames, format);
}

ossensor::Result<BinaryFormat> binary_format_from_string(std::string_view text)
{
    return enum_value(kBinaryFormatNames, text, "binary format");
}

std::string_view to_string(ExtractionStatus status)
{
    return enum_name(kStatusNames, status);
}

ossensor::Result<ExtractionStatus> extraction_status_from_string(std::string_view text)
{
    return enum_value(kStatusNames, text, "extraction status");
}

std::string_view to_string(MatchBasis basis)
{
    return enum_name(kMatchBasisNames, basis);
}

ossensor::Result<MatchBasis> match_basis_from_string(std::string_view text)
{
    return enum_value(kMatchBasisNames, text, "match basis");
}

// ============================================================================
// Stable ids
// ============================================================================

std::string make_artifact_id(std::string_view build_id, std::string_view component)
{
    return "bin:" + std::string(build_id) + "/" + std::string(component);
}

StableId make_hunk_id(const DiffHunk& hunk)
{
    std::string body;
    for (const auto& line : hunk.lines) {
        body += line;
        body += '\n';
    }
    return common::make_stable_id("hunk:",
                                  {hunk.file_path,
                                   std::to_string(hunk.old_start),
                                   std::to_string(hunk.old_count),
                                   std::to_string(hunk.new_start),
                                   std::to_string(hunk.new_count),
                                   body});
}

StableId make_feature_id(std::string_view hunk_id, FeatureKind kind, ChangeSide side)
{
    return common::make_stable_id("feat:", {hunk_id, to_string(kind), to_string(side)});
}

StableId make_string_id(std::string_view value)
{
    return common::make_stable_id("str:", {value});
}

StableId make_import_id(std::string_view name)
{
    return "imp:" + std::string(name);
}

StableId make_symbol_id(std::string_view name, std::size_t occurrence)
{
    std::string id = "sym:" + std::string(name);
    if (occurrence > 0) {
        id += "#" + std::to_string(occurrence);
    }
    return id;
}

StableId make_pair_id(const std::optional<StableId>& from_symbol,
                      const std::optional<StableId>& to_symbol)
{
    return common::make_stable_id("pair:",
                                  {from_symbol.value_or(std::string{}),
                                   to_symbol.value_or(std::string{})});
}

StableId make_template_id(std::string_view subsystem, std::string_view category, std::string_view format)
{
    return common::make_stable_id("tpl:", {subsystem, category, format});
}

StableId make_match_id(std::string_view template_id, std::string_view string_id)
{
    return common::make_stable_id("match:", {template_id, string_id});
}

std::vector<EvidenceRef> feature_refs(const SourceFeature& feature)
{
    std::vector<EvidenceRef> refs;
    refs.reserve(feature.hunk_ids.size() + 1);
    for (const auto& hunk_id : feature.hunk_ids) {
        refs.push_back(EvidenceRef{.type = RefType::kDiffHunk, .artifact_id = std::nullopt, .stable_id = hunk_id});
    }
    refs.push_back(
        EvidenceRef{.type = RefType::kSourceFeature, .artifact_id = std::nullopt, .stable_id = feature.feature_id});
    return refs;
}

// ============================================================================
// to_json
// ============================================================================

void to_json(nlohmann::json& j, const EvidenceRef& ref)
{
    j = nlohmann::json{
        { "ref_type", to_string(ref.type)},
        {"stable_id",       ref.stable_id}
    };
    if (ref.artifact_id) {
        j["artifact_id"] = *ref.artifact_id;
    }
}

void to_json(nlohmann::json& j, const DiffHunk& hunk)
{
    j = nlohmann::json{
        {  "hunk_id",   hunk.hunk_id},
        {"file_path", hunk.file_path},
        {"old_start", hunk.old_start},
        {"old_count", hunk.old_count},
        {"new_start", hunk.new_start},
        {"new_count", hunk.new_count},
        {    "lines",     hunk.lines}
    };
}

void to_json(nlohmann::json& j, const SourceFeature& feature)
{
    j = nlohmann::json{
        {"feature_id",   feature.feature_id},
        {      "kind", to_string(feature.kind)},
        {      "side", to_string(feature.side)},
        { "file_path",    feature.file_path},
        {  "hunk_ids",     feature.hunk_ids},
        {     "lines",        feature.lines},
        {   "guarded",      feature.guarded},
        {   "snippet",      feature.snippet}
    };
}

void to_json(nlohmann::json& j, const SkipNotice& notice)
{
    j = nlohmann::json{
        {"file_path", notice.file_path},
        {   "reason",    notice.reason}
    };
}

void to_json(nlohmann::json& j, const BinaryFeatureSet& set)
{
    nlohmann::json strings = nlohmann::json::array();
    for (const auto& s : set.strings) {
        strings.push_back({
            {"string_id", s.string_id},
            {    "value",     s.value}
        });
    }
    nlohmann::json imports = nlohmann::json::array();
    for (const auto& imp : set.imports) {
        imports.push_back({
            {"import_id", imp.import_id},
            {     "name",      imp.name}
        });
    }
    nlohmann::json symbols = nlohmann::json::array();
    for (const auto& sym : set.symbols) {
        symbols.push_back({
            {"symbol_id", sym.symbol_id},
            {     "name",      sym.name},
            {  "address",   sym.address}
        });
    }
    j = nlohmann::json{
        {       "artifact_id",        set.artifact_id},
        {          "build_id",           set.build_id},
        {         "component",          set.component},
        {            "format",  to_string(set.format)},
        {            "status",  to_string(set.status)},
        {           "notices",            set.notices},
        {    "content_sha256",     set.content_sha256},
        {           "strings",                strings},
        {           "imports",                imports},
        {           "symbols",                symbols},
        {"objc_metadata_stub", set.objc_metadata_stub}
    };
}

void to_json(nlohmann::json& j, const BinaryDiffPair& pair)
{
    j = nlohmann::json{
        {"pair_id",           pair.pair_id},
        {  "basis", to_string(pair.basis)},
        {   "name",              pair.name}
    };
    if (pair.from_symbol_id) {
        j["from_symbol_id"] = *pair.from_symbol_id;
    }
    if (pair.to_symbol_id) {
        j["to_symbol_id"] = *pair.to_symbol_id;
    }
    if (pair.from_address) {
        j["from_address"] = *pair.from_address;
    }
    if (pair.to_address) {
        j["to_address"] = *pair.to_address;
    }
}

void to_json(nlohmann::json& j, const LogTemplate& tpl)
{
    j = nlohmann::json{
        {  "template_id",   tpl.template_id},
        {    "subsystem",     tpl.subsystem},
        {     "category",      tpl.category},
        {"format_string", tpl.format_string},
        {  "occurrences",   tpl.occurrences},
        {      "samples",       tpl.samples}
    };
}

void to_json(nlohmann::json& j, const LogToBinaryMatch& match)
{
    j = nlohmann::json{
        {      "match_id",       match.match_id},
        {   "template_id",    match.template_id},
        {     "string_id",      match.string_id},
        {   "artifact_id",    match.artifact_id},
        {"matched_string", match.matched_string}
    };
}

// ============================================================================
// from_json
// ============================================================================

ossensor::Result<EvidenceRef> ref_from_json(const nlohmann::json& j)
{
    return guarded_read<EvidenceRef>("evidence ref", [&]() -> ossensor::Result<EvidenceRef> {
        auto type = ref_type_from_string(j.at("ref_type").get<std::string>());
        if (!type) {
            return std::unexpected(type.error());
        }
        return EvidenceRef{.type = *type,
                           .artifact_id = optional_field<std::string>(j, "artifact_id"),
                           .stable_id = j.at("stable_id").get<std::string>()};
    });
}

ossensor::Result<DiffHunk> hunk_from_json(const nlohmann::json& j)
{
    return guarded_read<DiffHunk>("diff hunk", [&]() -> ossensor::Result<DiffHunk> {
        return DiffHunk{.hunk_id = j.at("hunk_id").get<std::string>(),
                        .file_path = j.at("file_path").get<std::string>(),
                        .old_start = j.at("old_start").get<std::uint32_t>(),
                        .old_count = j.at("old_count").get<std::uint32_t>(),
                        .new_start = j.at("new_start").get<std::uint32_t>(),
                        .new_count = j.at("new_count").get<std::uint32_t>(),
                        .lines = j.at("lines").get<std::vector<std::string>>()};
    });
}

ossensor::Result<SourceFeature> feature_from_json(const nlohmann::json& j)
{
    return guarded_read<SourceFeature>("source feature", [&]() -> ossensor::Result<SourceFeature> {
        auto kind = feature_kind_from_string(j.at("kind").get<std::string>());
        if (!kind) {
            return std::unexpected(kind.error());
        }
        auto side = change_side_from_string(j.at("side").get<std::string>());
        if (!side) {
            return std::unexpected(side.error());
        }
        return SourceFeature{.feature_id = j.at("feature_id").get<std::string>(),
                             .kind = *kind,
                             .side = *side,
                             .file_path = j.at("file_path").get<std::string>(),
                             .hunk_ids = j.at("hunk_ids").get<std::vector<std::string>>(),
                             .lines = j.at("lines").get<std::vector<std::uint32_t>>(),
                             .guarded = j.value("guarded", false),
                             .snippet = j.value("snippet", std::string{})};
    });
}

ossensor::Result<SkipNotice> skip_from_json(const nlohmann::json& j)
{
    return guarded_read<SkipNotice>("skip notice", [&]() -> ossensor::Result<SkipNotice> {
        return SkipNotice{.file_path = j.at("file_path").get<std::string>(),
                          .reason = j.at("reason").get<std::string>()};
    });
}

ossensor::Result<BinaryFeatureSet> feature_set_from_json(const nlohmann::json& j)
{
    return guarded_read<BinaryFeatureSet>(
        "binary feature set",
        [&]() -> ossensor::Result<BinaryFeatureSet> {
            auto format = binary_format_from_string(j.at("format").get<std::string>());
            if (!format) {
                return std::unexpected(format.error());
            }
            auto status = extraction_status_from_string(j.at("status").get<std::string>());
            if (!status) {
                return std::unexpected(status.error());
            }
            BinaryFeatureSet set;
            set.artifact_id = j.at("artifact_id").get<std::string>();
            set.build_id = j.at("build_id").get<std::string>();
            set.component = j.at("component").get<std::string>();
            set.format = *format;
            set.status = *status;
            set.notices = j.at("notices").get<std::vector<std::string>>();
            set.content_sha256 = j.value("content_sha256", std::string{});
            for (const auto& s : j.at("strings")) {
                set.strings.push_back(BinaryString{.string_id = s.at("string_id").get<std::string>(),
                                                   .value = s.at("value").get<std::string>()});
            }
            for (const auto& imp : j.at("imports")) {
                set.imports.push_back(BinaryImport{.import_id = imp.at("import_id").get<std::string>(),
                                                   .name = imp.at("name").get<std::string>()});
            }
            for (const auto& sym : j.at("symbols")) {
                set.symbols.push_back(BinarySymbol{.symbol_id = sym.at("symbol_id").get<std::string>(),
                                                   .name = sym.at("name").get<std::string>(),
                                                   .address = sym.at("address").get<std::uint64_t>()});
            }
            set.objc_metadata_stub = j.at("objc_metadata_stub").get<std::vector<std::string>>();
            return set;
        });
}

ossensor::Result<BinaryDiffPair> pair_from_json(const nlohmann::json& j)
{
    return guarded_read<BinaryDiffPair>("binary diff pair", [&]() -> ossensor::Result<BinaryDiffPair> {
        auto basis = match_basis_from_string(j.at("basis").get<std::string>());
        if (!basis) {
            return std::unexpected(basis.error());
        }
        return BinaryDiffPair{.pair_id = j.at("pair_id").get<std::string>(),
                              .basis = *basis,
                              .name = j.at("name").get<std::string>(),
                              .from_symbol_id = optional_field<std::string>(j, "from_symbol_id"),
                              .to_symbol_id = optional_field<std::string>(j, "to_symbol_id"),
                              .from_address = optional_field<std::uint64_t>(j, "from_address"),
                              .to_address = optional_field<std::uint64_t>(j, "to_address")};
    });
}

ossensor::Result<LogTemplate> template_from_json(const nlohmann::json& j)
{
    return guarded_read<LogTemplate>("log template", [&]() -> ossensor::Result<LogTemplate> {
        return LogTemplate{.template_id = j.at("template_id").get<std::string>(),
                           .subsystem = j.at("subsystem").get<std::string>(),
                           .category = j.at("category").get<std::string>(),
                           .format_string = j.at("format_string").get<std::string>(),
                           .occurrences = j.at("occurrences").get<std::uint64_t>(),
                           .samples = j.at("samples").get<std::vector<std::string>>()};
    });
}

ossensor::Result<LogToBinaryMatch> match_from_json(const nlohmann::json& j)
{
    return guarded_read<LogToBinaryMatch>(
        "log-to-binary match",
        [&]() -> ossensor::Result<LogToBinaryMatch> {
            return LogToBinaryMatch{.match_id = j.at("match_id").get<std::string>(),
                                    .template_id = j.at("template_id").get<std::string>(),
                                    .string_id = j.at("string_id").get<std::string>(),
                                    .artifact_id = j.at("artifact_id").get<std::string>(),
                                    .matched_string = j.at("matched_string").get<std::string>()};
        });
}

}  // namespace ossensor::evidence
