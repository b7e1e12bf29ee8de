/**
 * @file binary_features.cpp
 * @brief BinaryFeatureExtractor implementation
 */

#include "ossensor/binary_features.hpp"

#include "elf_reader.hpp"
#include "macho_reader.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <map>
#include <string_view>
#include <unordered_set>

#include <spdlog/spdlog.h>

namespace ossensor::binary {

namespace {

using evidence::BinaryFeatureSet;
using evidence::BinaryFormat;
using evidence::ExtractionStatus;

[[nodiscard]] bool is_printable(std::uint8_t byte)
{
    return (byte >= 0x20 && byte <= 0x7e) || byte == '\t';
}

[[nodiscard]] BinaryFeatureSet make_empty_set(const ArtifactLabel& label)
{
    BinaryFeatureSet set;
    set.artifact_id = evidence::make_artifact_id(label.build_id, label.component);
    set.build_id = label.build_id;
    set.component = label.component;
    return set;
}

/// Degrade a set to empty-with-notice
void mark_degraded(BinaryFeatureSet& set, ExtractionStatus status, std::string notice)
{
    set.status = status;
    set.strings.clear();
    set.imports.clear();
    set.symbols.clear();
    set.objc_metadata_stub.clear();
    set.notices.push_back(std::move(notice));
    spdlog::warn("binary {}: {} ({})", set.artifact_id, evidence::to_string(status), set.notices.back());
}

[[nodiscard]] std::vector<std::string> dedupe_in_order(std::vector<std::string> values)
{
    std::unordered_set<std::string> seen;
    std::vector<std::string> unique;
    unique.reserve(values.size());
    for (auto& value : values) {
        if (seen.insert(value).second) {
            unique.push_back(std::move(value));
        }
    }
    return unique;
}

}  // namespace

BinaryFormat detect_format(std::span<const std::uint8_t> data)
{
    if (data.size() < 4) {
        return BinaryFormat::kUnknown;
    }
    if (has_elf_magic(data)) {
        return BinaryFormat::kElf;
    }
    if (auto kind = detect_macho(data)) {
        return *kind == MachOKind::kFat ? BinaryFormat::kMachOFat : BinaryFormat::kMachO;
    }
    return BinaryFormat::kUnknown;
}

std::vector<std::string> extract_printable_strings(std::span<const std::uint8_t> data,
                                                   std::size_t min_length,
                                                   std::size_t max_count,
                                                   bool& capped)
{
    capped = false;
    std::vector<std::string> strings;
    std::unordered_set<std::string> seen;
    std::size_t run_start = 0;
    for (std::size_t i = 0; i <= data.size(); ++i) {
        if (i < data.size() && is_printable(data[i])) {
            continue;
        }
        const std::size_t run_length = i - run_start;
        if (run_length >= min_length) {
            std::string value(reinterpret_cast<const char*>(data.data() + run_start), run_length);
            if (!seen.contains(value)) {
                if (strings.size() == max_count) {
                    capped = true;
                    return strings;
                }
                seen.insert(value);
                strings.push_back(std::move(value));
            }
        }
        run_start = i + 1;
    }
    return strings;
}

BinaryFeatureExtractor::BinaryFeatureExtractor(BinaryExtractOptions options)
    : m_options(options)
{}

BinaryFeatureSet BinaryFeatureExtractor::extract_file(const std::filesystem::path& path,
                                                      const ArtifactLabel& label) const
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        BinaryFeatureSet set = make_empty_set(label);
        mark_degraded(set, ExtractionStatus::kUnreadable, "cannot open " + path.string());
        return set;
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        BinaryFeatureSet set = make_empty_set(label);
        mark_degraded(set, ExtractionStatus::kUnreadable, "read error on " + path.string());
        return set;
    }
    spdlog::debug("binary {}: read {} bytes from {}", label.component, bytes.size(), path.string());
    return extract_bytes(bytes, label);
}

BinaryFeatureSet BinaryFeatureExtractor::extract_bytes(std::span<const std::uint8_t> data,
                                                       const ArtifactLabel& label) const
{
    BinaryFeatureSet set = make_empty_set(label);
    set.content_sha256 = common::sha256_prefixed(
        std::string_view(reinterpret_cast<const char*>(data.data()), data.size()));
    set.format = detect_format(data);

    Result<ParsedImage> parsed = std::unexpected(Error::make("Unsupported", ""));
    switch (set.format) {
        case BinaryFormat::kElf:
            parsed = parse_elf(data);
            break;
        case BinaryFormat::kMachO:
        case BinaryFormat::kMachOFat:
            parsed = parse_macho(data);
            break;
        case BinaryFormat::kUnknown:
            mark_degraded(set,
                          ExtractionStatus::kUnsupported,
                          data.size() < 4 ? "file too small to identify ("
                                                + std::to_string(data.size()) + " bytes)"
                                          : std::string("unrecognized binary format"));
            return set;
    }

    if (!parsed) {
        const bool truncated = parsed.error().code == kTruncatedCode;
        mark_degraded(set,
                      truncated ? ExtractionStatus::kTruncated : ExtractionStatus::kMalformed,
                      parsed.error().message);
        return set;
    }

    bool capped = false;
    for (auto& value :
         extract_printable_strings(data, m_options.min_string_length, m_options.max_strings, capped)) {
        set.strings.push_back(evidence::BinaryString{.string_id = evidence::make_string_id(value),
                                                     .value = std::move(value)});
    }
    if (capped) {
        set.notices.push_back("string table capped at " + std::to_string(m_options.max_strings)
                              + " entries");
    }

    for (auto& name : dedupe_in_order(std::move(parsed->imports))) {
        set.imports.push_back(evidence::BinaryImport{.import_id = evidence::make_import_id(name),
                                                     .name = std::move(name)});
    }

    std::map<std::string, std::size_t> occurrences;
    for (auto& symbol : parsed->symbols) {
        const std::size_t occurrence = occurrences[symbol.name]++;
        set.symbols.push_back(
            evidence::BinarySymbol{.symbol_id = evidence::make_symbol_id(symbol.name, occurrence),
                                   .name = std::move(symbol.name),
                                   .address = symbol.address});
    }

    set.objc_metadata_stub = dedupe_in_order(std::move(parsed->objc_sections));
    std::ranges::move(parsed->notices, std::back_inserter(set.notices));

    spdlog::debug("binary {}: {} strings, {} imports, {} symbols",
                  set.artifact_id,
                  set.strings.size(),
                  set.imports.size(),
                  set.symbols.size());
    return set;
}

}  // namespace ossensor::binary
