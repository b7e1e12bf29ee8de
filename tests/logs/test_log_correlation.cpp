/**
 * @file test_log_correlation.cpp
 * @brief Literal fragment matching between log templates and binary strings
 */

#include "ossensor/log_correlation.hpp"

#include "ossensor/log_templates.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ossensor::logs::test {

using evidence::BinaryFeatureSet;
using evidence::BinaryString;
using evidence::LogTemplate;

namespace {

LogTemplate make_template(std::string format)
{
    LogTemplate tpl;
    tpl.template_id = evidence::make_template_id("parser", "io", format);
    tpl.subsystem = "parser";
    tpl.category = "io";
    tpl.format_string = std::move(format);
    tpl.occurrences = 1;
    return tpl;
}

BinaryFeatureSet make_binary(const std::vector<std::string>& strings)
{
    BinaryFeatureSet set;
    set.artifact_id = evidence::make_artifact_id("1.1", "libparse");
    set.build_id = "1.1";
    set.component = "libparse";
    for (const auto& value : strings) {
        set.strings.push_back(BinaryString{.string_id = evidence::make_string_id(value), .value = value});
    }
    return set;
}

}  // namespace

TEST(LiteralFragments, SplitAtPlaceholders)
{
    EXPECT_EQ(literal_fragments("Invalid header length <num> for record <hex>", 8),
              (std::vector<std::string>{"Invalid header length", "for record"}));
    EXPECT_EQ(literal_fragments("<num> <str>", 1), std::vector<std::string>{});
    EXPECT_EQ(literal_fragments("id <uuid> ok", 3), std::vector<std::string>{});
    EXPECT_EQ(literal_fragments("no placeholders here", 8), std::vector<std::string>{"no placeholders here"});
}

TEST(LogBinaryCorrelator, FragmentInsideBinaryString)
{
    const auto templates = std::vector<LogTemplate>{make_template("Invalid header length <num> for record <hex>")};
    const auto binary = make_binary({"GLIBC_2.2.5", "Invalid header length %u for record %p", "unrelated text"});

    const LogBinaryCorrelator correlator;
    const auto matches = correlator.correlate(templates, binary);
    ASSERT_EQ(matches.size(), 1U);
    EXPECT_EQ(matches[0].template_id, templates[0].template_id);
    EXPECT_EQ(matches[0].string_id, binary.strings[1].string_id);
    EXPECT_EQ(matches[0].artifact_id, "bin:1.1/libparse");
    EXPECT_EQ(matches[0].matched_string, "Invalid header length %u for record %p");
    EXPECT_EQ(matches[0].match_id, evidence::make_match_id(matches[0].template_id, matches[0].string_id));
}

TEST(LogBinaryCorrelator, BinaryStringInsideFragmentDoesNotMatch)
{
    const auto templates = std::vector<LogTemplate>{make_template("fatal: record table corrupted at <num>")};
    const auto binary = make_binary({"record table corrupted", "table", "fatal: record table corrupted at"});

    const LogBinaryCorrelator correlator;
    const auto matches = correlator.correlate(templates, binary);
    ASSERT_EQ(matches.size(), 1U);
    EXPECT_EQ(matches[0].matched_string, "fatal: record table corrupted at");
}

TEST(LogBinaryCorrelator, LoggedLiteralMatchesOnceDespiteSymbolNames)
{
    std::istringstream log("Jan  3 10:00:00 host parserd[7]: parse_header: invalid length 4096\n"
                           "Jan  3 10:00:01 host parserd[7]: connection reset by peer\n");
    const auto templates = LogTemplateExtractor{}.extract(log);
    ASSERT_EQ(templates.size(), 2U);

    const auto binary = make_binary({"parse_header", "parse_header: invalid length %u", "GLIBC_2.2.5"});
    const auto matches = LogBinaryCorrelator{}.correlate(templates, binary);
    ASSERT_EQ(matches.size(), 1U);
    EXPECT_EQ(matches[0].template_id, templates[0].template_id);
    EXPECT_EQ(matches[0].matched_string, "parse_header: invalid length %u");
}

TEST(LogBinaryCorrelator, ShortFragmentsIgnored)
{
    const auto templates = std::vector<LogTemplate>{make_template("rc <num> ok")};
    const auto binary = make_binary({"rc %d ok", "status rc"});
    EXPECT_TRUE(LogBinaryCorrelator().correlate(templates, binary).empty());
}

TEST(LogBinaryCorrelator, OrderIsTemplateThenString)
{
    const auto templates = std::vector<LogTemplate>{
        make_template("second template message <num>"),
        make_template("first template message <num>"),
    };
    const auto binary = make_binary({"first template message %d", "second template message %d"});

    const auto matches = LogBinaryCorrelator(CorrelationOptions{.min_fragment_length = 8}).correlate(templates, binary);
    ASSERT_EQ(matches.size(), 2U);
    EXPECT_EQ(matches[0].template_id, templates[0].template_id);
    EXPECT_EQ(matches[0].matched_string, "second template message %d");
    EXPECT_EQ(matches[1].template_id, templates[1].template_id);
}

TEST(LogBinaryCorrelator, EmptyBinaryMatchesNothing)
{
    const auto templates = std::vector<LogTemplate>{make_template("Invalid header length <num>")};
    EXPECT_TRUE(LogBinaryCorrelator().correlate(templates, make_binary({})).empty());
}

}  // namespace ossensor::logs::test
