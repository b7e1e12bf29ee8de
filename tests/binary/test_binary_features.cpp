/**
 * @file test_binary_features.cpp
 * @brief BinaryFeatureExtractor over synthetic ELF and Mach-O images
 */

#include "ossensor/binary_features.hpp"

#include "binary_images.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ossensor::binary::test {

using evidence::BinaryFeatureSet;
using evidence::BinaryFormat;
using evidence::ExtractionStatus;
using ossensor::test::ImageSymbol;
using namespace std::string_literals;

namespace {

const ArtifactLabel kLabel{.build_id = "1.1", .component = "libparse"};

std::vector<std::uint8_t> sample_elf()
{
    return ossensor::test::make_elf64(
        {
            ImageSymbol{.name = "parse_header", .address = 0x1000},
            ImageSymbol{.name = "helper", .address = 0x1100},
            ImageSymbol{.name = "helper", .address = 0x1200},
            ImageSymbol{.name = "malloc", .address = 0, .defined = false},
        },
        {"libc.so.6"},
        "Error: invalid header length");
}

bool has_string(const BinaryFeatureSet& set, std::string_view value)
{
    return std::ranges::any_of(set.strings, [&](const auto& s) { return s.value == value; });
}

std::vector<std::string> import_names(const BinaryFeatureSet& set)
{
    std::vector<std::string> names;
    for (const auto& imp : set.imports) {
        names.push_back(imp.name);
    }
    return names;
}

void expect_degraded(const BinaryFeatureSet& set, ExtractionStatus status)
{
    EXPECT_EQ(set.status, status);
    EXPECT_FALSE(set.notices.empty());
    EXPECT_TRUE(set.strings.empty());
    EXPECT_TRUE(set.imports.empty());
    EXPECT_TRUE(set.symbols.empty());
    EXPECT_TRUE(set.objc_metadata_stub.empty());
}

}  // namespace

TEST(DetectFormat, Magics)
{
    EXPECT_EQ(detect_format(sample_elf()), BinaryFormat::kElf);
    const auto macho = ossensor::test::make_macho64({}, {}, "", false);
    EXPECT_EQ(detect_format(macho), BinaryFormat::kMachO);
    EXPECT_EQ(detect_format(ossensor::test::make_fat(macho)), BinaryFormat::kMachOFat);

    const std::vector<std::uint8_t> java_class = {0xca, 0xfe, 0xba, 0xbe, 0x00, 0x00, 0x00, 0x34};
    EXPECT_EQ(detect_format(java_class), BinaryFormat::kUnknown);
    const std::vector<std::uint8_t> tiny = {0x7f, 'E', 'L'};
    EXPECT_EQ(detect_format(tiny), BinaryFormat::kUnknown);
}

TEST(PrintableStrings, MinimumLengthAndDedup)
{
    const std::string blob = "short\0long enough\0\x01\x02long enough\0tab\tseparated"s;
    const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(blob.data()), blob.size());
    bool capped = true;
    auto strings = extract_printable_strings(bytes, 6, 100, capped);
    EXPECT_FALSE(capped);
    EXPECT_EQ(strings, (std::vector<std::string>{"long enough", "tab\tseparated"}));
}

TEST(PrintableStrings, CapIsReported)
{
    const std::string blob = "aaaaaa\0bbbbbb\0cccccc"s;
    const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(blob.data()), blob.size());
    bool capped = false;
    auto strings = extract_printable_strings(bytes, 6, 2, capped);
    EXPECT_TRUE(capped);
    EXPECT_EQ(strings, (std::vector<std::string>{"aaaaaa", "bbbbbb"}));
}

TEST(BinaryFeatureExtractor, ElfSymbolsImportsAndStrings)
{
    const BinaryFeatureExtractor extractor;
    const auto set = extractor.extract_bytes(sample_elf(), kLabel);

    EXPECT_EQ(set.artifact_id, "bin:1.1/libparse");
    EXPECT_EQ(set.build_id, "1.1");
    EXPECT_EQ(set.component, "libparse");
    EXPECT_EQ(set.format, BinaryFormat::kElf);
    ASSERT_EQ(set.status, ExtractionStatus::kOk) << (set.notices.empty() ? "" : set.notices.front());
    EXPECT_TRUE(set.content_sha256.starts_with("sha256:"));

    ASSERT_EQ(set.symbols.size(), 3U);
    EXPECT_EQ(set.symbols[0].name, "parse_header");
    EXPECT_EQ(set.symbols[0].address, 0x1000U);
    EXPECT_EQ(set.symbols[0].symbol_id, "sym:parse_header");
    EXPECT_EQ(set.symbols[1].symbol_id, "sym:helper");
    EXPECT_EQ(set.symbols[2].symbol_id, "sym:helper#1");

    EXPECT_EQ(import_names(set), (std::vector<std::string>{"malloc", "libc.so.6"}));
    EXPECT_EQ(set.imports[0].import_id, "imp:malloc");

    EXPECT_TRUE(has_string(set, "Error: invalid header length"));
    for (const auto& s : set.strings) {
        EXPECT_EQ(s.string_id, evidence::make_string_id(s.value));
    }
}

TEST(BinaryFeatureExtractor, ExtractionIsDeterministic)
{
    const BinaryFeatureExtractor extractor;
    const auto first = extractor.extract_bytes(sample_elf(), kLabel);
    const auto second = extractor.extract_bytes(sample_elf(), kLabel);
    nlohmann::json a = first;
    nlohmann::json b = second;
    EXPECT_EQ(a, b);
}

TEST(BinaryFeatureExtractor, MachOThin)
{
    const BinaryFeatureExtractor extractor;
    const auto image = ossensor::test::make_macho64(
        {
            ImageSymbol{.name = "_parse_header", .address = 0x100003f00},
            ImageSymbol{.name = "_malloc", .address = 0, .defined = false},
        },
        {"/usr/lib/libSystem.B.dylib"},
        "Invalid record count",
        true);
    const auto set = extractor.extract_bytes(image, kLabel);

    EXPECT_EQ(set.format, BinaryFormat::kMachO);
    ASSERT_EQ(set.status, ExtractionStatus::kOk) << (set.notices.empty() ? "" : set.notices.front());
    ASSERT_EQ(set.symbols.size(), 1U);
    EXPECT_EQ(set.symbols[0].name, "_parse_header");
    EXPECT_EQ(set.symbols[0].address, 0x100003f00U);
    EXPECT_EQ(import_names(set), (std::vector<std::string>{"/usr/lib/libSystem.B.dylib", "_malloc"}));
    EXPECT_EQ(set.objc_metadata_stub, std::vector<std::string>{"__DATA,__objc_classlist"});
    EXPECT_TRUE(has_string(set, "Invalid record count"));
}

TEST(BinaryFeatureExtractor, MachOFatReadsFirstSlice)
{
    const BinaryFeatureExtractor extractor;
    const auto slice = ossensor::test::make_macho64({ImageSymbol{.name = "_main", .address = 0x4000}}, {}, "", false);
    const auto set = extractor.extract_bytes(ossensor::test::make_fat(slice), kLabel);

    EXPECT_EQ(set.format, BinaryFormat::kMachOFat);
    ASSERT_EQ(set.status, ExtractionStatus::kOk);
    ASSERT_EQ(set.symbols.size(), 1U);
    EXPECT_EQ(set.symbols[0].name, "_main");
    EXPECT_TRUE(std::ranges::any_of(set.notices, [](const std::string& n) {
        return n.find("slice 0") != std::string::npos;
    }));
}

TEST(BinaryFeatureExtractor, TruncatedElf)
{
    const BinaryFeatureExtractor extractor;
    auto image = sample_elf();
    image.resize(40);
    const auto set = extractor.extract_bytes(image, kLabel);
    EXPECT_EQ(set.format, BinaryFormat::kElf);
    expect_degraded(set, ExtractionStatus::kTruncated);
    // The hash covers whatever bytes were read
    EXPECT_TRUE(set.content_sha256.starts_with("sha256:"));
}

TEST(BinaryFeatureExtractor, SectionTablePastEnd)
{
    const BinaryFeatureExtractor extractor;
    auto image = sample_elf();
    image.resize(image.size() - 10);
    expect_degraded(extractor.extract_bytes(image, kLabel), ExtractionStatus::kTruncated);
}

TEST(BinaryFeatureExtractor, MalformedElfEncoding)
{
    const BinaryFeatureExtractor extractor;
    auto image = sample_elf();
    image[EI_DATA] = 7;
    expect_degraded(extractor.extract_bytes(image, kLabel), ExtractionStatus::kMalformed);
}

TEST(BinaryFeatureExtractor, MalformedMachOLoadCommand)
{
    const BinaryFeatureExtractor extractor;
    auto image = ossensor::test::make_macho64({}, {}, "", false);
    // cmdsize of the first load command below the 8-byte minimum
    image[36] = 4;
    image[37] = 0;
    image[38] = 0;
    image[39] = 0;
    expect_degraded(extractor.extract_bytes(image, kLabel), ExtractionStatus::kMalformed);
}

TEST(BinaryFeatureExtractor, UnknownFormatIsUnsupported)
{
    const BinaryFeatureExtractor extractor;
    const std::string text = "just some text, not an executable";
    const std::vector<std::uint8_t> bytes(text.begin(), text.end());
    const auto set = extractor.extract_bytes(bytes, kLabel);
    EXPECT_EQ(set.format, BinaryFormat::kUnknown);
    expect_degraded(set, ExtractionStatus::kUnsupported);

    const std::vector<std::uint8_t> tiny = {1, 2};
    const auto tiny_set = extractor.extract_bytes(tiny, kLabel);
    expect_degraded(tiny_set, ExtractionStatus::kUnsupported);
    EXPECT_NE(tiny_set.notices.front().find("too small"), std::string::npos);
}

TEST(BinaryFeatureExtractor, FileRoundTrip)
{
    ossensor::test::TempDir dir("ossensor_binary_file");
    const auto path = dir.path() / "libparse.so";
    ossensor::test::write_bytes(path, sample_elf());

    const BinaryFeatureExtractor extractor;
    const auto from_file = extractor.extract_file(path, kLabel);
    const auto from_bytes = extractor.extract_bytes(sample_elf(), kLabel);
    EXPECT_EQ(from_file.status, ExtractionStatus::kOk);
    EXPECT_EQ(from_file.content_sha256, from_bytes.content_sha256);
    EXPECT_EQ(from_file.symbols.size(), from_bytes.symbols.size());
}

TEST(BinaryFeatureExtractor, MissingFileIsUnreadable)
{
    const BinaryFeatureExtractor extractor;
    const auto set = extractor.extract_file("/nonexistent/ossensor/lib.so", kLabel);
    EXPECT_EQ(set.artifact_id, "bin:1.1/libparse");
    expect_degraded(set, ExtractionStatus::kUnreadable);
    EXPECT_TRUE(set.content_sha256.empty());
}

TEST(BinaryFeatureExtractor, StringCapAddsNotice)
{
    const BinaryFeatureExtractor extractor(BinaryExtractOptions{.min_string_length = 4, .max_strings = 2});
    const auto set = extractor.extract_bytes(sample_elf(), kLabel);
    ASSERT_EQ(set.status, ExtractionStatus::kOk);
    EXPECT_EQ(set.strings.size(), 2U);
    EXPECT_TRUE(std::ranges::any_of(set.notices, [](const std::string& n) {
        return n.find("capped") != std::string::npos;
    }));
}

}  // namespace ossensor::binary::test
