#pragma once

/**
 * @file evidence.hpp
 * @brief Evidence data model shared by every pipeline stage
 *
 * Cross-entity links are StableId strings resolved by lookup inside an
 * EvidenceBundle; no entity holds a pointer to another. Every StableId is
 * namespaced by its kind prefix so ids from different extractors can never
 * collide:
 *
 *   hunk:  source diff hunk         feat:  source feature
 *   str:   binary string            imp:   binary import
 *   sym:   binary symbol            pair:  binary diff pair
 *   tpl:   log template             match: log-to-binary match
 */

#include "ossensor/common.hpp"

#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ossensor::evidence {

using StableId = std::string;

// ============================================================================
// Evidence references
// ============================================================================

/**
 * Kind of entity an EvidenceRef points at.
 *
 * Naming convention: kPascalCase for enum constants (Google C++ Style Guide)
 */
enum class RefType {
    kDiffHunk,
    kSourceFeature,
    kBinaryString,
    kBinaryImport,
    kBinarySymbol,
    kBinaryDiffPair,
    kLogTemplate,
    kLogBinaryMatch,
};

[[nodiscard]] std::string_view to_string(RefType type);
[[nodiscard]] ossensor::Result<RefType> ref_type_from_string(std::string_view text);

/**
 * @brief The only vocabulary by which consumers point at evidence.
 *
 * artifact_id is set for binary refs and names the BinaryFeatureSet
 * ("bin:<build_id>/<component>") the id lives in.
 */
struct EvidenceRef
{
    RefType type;
    std::optional<std::string> artifact_id;
    StableId stable_id;

    auto operator<=>(const EvidenceRef&) const = default;
    bool operator==(const EvidenceRef&) const = default;
};

// ============================================================================
// Source diff
// ============================================================================

/**
 * @brief One contiguous changed region of a file.
 *
 * lines[] use unified-diff prefixes: ' ' context, '-' removed, '+' added.
 * A side whose count is 0 also has start 0 when the whole file is missing on
 * that side; otherwise start is the line preceding the (empty) region.
 */
struct DiffHunk
{
    StableId hunk_id;
    std::string file_path;
    std::uint32_t old_start = 0;
    std::uint32_t old_count = 0;
    std::uint32_t new_start = 0;
    std::uint32_t new_count = 0;
    std::vector<std::string> lines;
};

enum class FeatureKind {
    kAllocationSizing,
    kBoundsCheckAdded,
    kBoundsCheckRemoved,
    kParsingLogic,
    kPrivilegeCheckAdded,
    kPrivilegeCheckRemoved,
};

[[nodiscard]] std::string_view to_string(FeatureKind kind);
[[nodiscard]] ossensor::Result<FeatureKind> feature_kind_from_string(std::string_view text);

/// Which side of a hunk the triggering lines were on
enum class ChangeSide { kAdded, kRemoved };

[[nodiscard]] std::string_view to_string(ChangeSide side);
[[nodiscard]] ossensor::Result<ChangeSide> change_side_from_string(std::string_view text);

struct SourceFeature
{
    StableId feature_id;
    FeatureKind kind;
    ChangeSide side;
    std::string file_path;
    std::vector<StableId> hunk_ids;
    std::vector<std::uint32_t> lines;  ///< Triggering line numbers on `side`
    bool guarded = false;              ///< Allocation sizing only: guard precedes it
    std::string snippet;
};

/// A source file that could not be diffed; recorded, never fatal
struct SkipNotice
{
    std::string file_path;
    std::string reason;
};

// ============================================================================
// Binary features
// ============================================================================

enum class BinaryFormat { kUnknown, kElf, kMachO, kMachOFat };

[[nodiscard]] std::string_view to_string(BinaryFormat format);
[[nodiscard]] ossensor::Result<BinaryFormat> binary_format_from_string(std::string_view text);

/**
 * Extraction outcome. Anything but kOk leaves every feature list empty and
 * carries at least one notice explaining why.
 */
enum class ExtractionStatus { kOk, kTruncated, kMalformed, kUnsupported, kUnreadable };

[[nodiscard]] std::string_view to_string(ExtractionStatus status);
[[nodiscard]] ossensor::Result<ExtractionStatus> extraction_status_from_string(std::string_view text);

struct BinaryString
{
    StableId string_id;
    std::string value;
};

struct BinaryImport
{
    StableId import_id;
    std::string name;
};

struct BinarySymbol
{
    StableId symbol_id;
    std::string name;
    std::uint64_t address = 0;
};

struct BinaryFeatureSet
{
    std::string artifact_id;
    std::string build_id;
    std::string component;
    BinaryFormat format = BinaryFormat::kUnknown;
    ExtractionStatus status = ExtractionStatus::kOk;
    std::vector<std::string> notices;
    std::string content_sha256;
    std::vector<BinaryString> strings;
    std::vector<BinaryImport> imports;
    std::vector<BinarySymbol> symbols;
    std::vector<std::string> objc_metadata_stub;
};

[[nodiscard]] std::string make_artifact_id(std::string_view build_id, std::string_view component);

enum class MatchBasis { kName, kAddress, kNone };

[[nodiscard]] std::string_view to_string(MatchBasis basis);
[[nodiscard]] ossensor::Result<MatchBasis> match_basis_from_string(std::string_view text);

/**
 * @brief A symbol pairing between the from and to builds.
 *
 * Unmatched symbols are pairs with basis kNone and only one side set.
 */
struct BinaryDiffPair
{
    StableId pair_id;
    MatchBasis basis = MatchBasis::kNone;
    std::string name;
    std::optional<StableId> from_symbol_id;
    std::optional<StableId> to_symbol_id;
    std::optional<std::uint64_t> from_address;
    std::optional<std::uint64_t> to_address;
};

// ============================================================================
// Logs
// ============================================================================

struct LogTemplate
{
    StableId template_id;
    std::string subsystem;
    std::string category;
    std::string format_string;
    std::uint64_t occurrences = 0;
    std::vector<std::string> samples;
};

struct LogToBinaryMatch
{
    StableId match_id;
    StableId template_id;
    StableId string_id;
    std::string artifact_id;
    std::string matched_string;
};

// ============================================================================
// Stable id builders
// ============================================================================

[[nodiscard]] StableId make_hunk_id(const DiffHunk& hunk);
[[nodiscard]] StableId make_feature_id(std::string_view hunk_id, FeatureKind kind, ChangeSide side);
[[nodiscard]] StableId make_string_id(std::string_view value);
[[nodiscard]] StableId make_import_id(std::string_view name);
/// occurrence is 0 for the first symbol with a given name
[[nodiscard]] StableId make_symbol_id(std::string_view name, std::size_t occurrence);
[[nodiscard]] StableId make_pair_id(const std::optional<StableId>& from_symbol,
                                    const std::optional<StableId>& to_symbol);
[[nodiscard]] StableId
make_template_id(std::string_view subsystem, std::string_view category, std::string_view format);
[[nodiscard]] StableId make_match_id(std::string_view template_id, std::string_view string_id);

/// Refs to a feature's hunks, in hunk_ids order, followed by the feature itself
[[nodiscard]] std::vector<EvidenceRef> feature_refs(const SourceFeature& feature);

// ============================================================================
// JSON conversion
// ============================================================================
// to_json never fails. The from_json readers validate enum spellings and
// required fields and report ParseError instead of throwing.

void to_json(nlohmann::json& j, const EvidenceRef& ref);
void to_json(nlohmann::json& j, const DiffHunk& hunk);
void to_json(nlohmann::json& j, const SourceFeature& feature);
void to_json(nlohmann::json& j, const SkipNotice& notice);
void to_json(nlohmann::json& j, const BinaryFeatureSet& set);
void to_json(nlohmann::json& j, const BinaryDiffPair& pair);
void to_json(nlohmann::json& j, const LogTemplate& tpl);
void to_json(nlohmann::json& j, const LogToBinaryMatch& match);

[[nodiscard]] ossensor::Result<EvidenceRef> ref_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<DiffHunk> hunk_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<SourceFeature> feature_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<SkipNotice> skip_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<BinaryFeatureSet> feature_set_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<BinaryDiffPair> pair_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<LogTemplate> template_from_json(const nlohmann::json& j);
[[nodiscard]] ossensor::Result<LogToBinaryMatch> match_from_json(const nlohmann::json& j);

}  // namespace ossensor::evidence
