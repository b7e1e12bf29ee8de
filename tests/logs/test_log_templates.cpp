/**
 * @file test_log_templates.cpp
 * @brief Log line parsing and template extraction
 */

#include "ossensor/log_templates.hpp"

#include "test_support.hpp"

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ossensor::logs::test {

TEST(ParseLogLine, IsoTimestampProcessAndTag)
{
    const auto parsed = parse_log_line(
        "2024-05-01T12:00:00.123Z host parserd[123]: [com.example.parser:io] Invalid header length 42");
    EXPECT_EQ(parsed.subsystem, "com.example.parser");
    EXPECT_EQ(parsed.category, "io");
    EXPECT_EQ(parsed.message, "Invalid header length 42");
}

TEST(ParseLogLine, SyslogTimestamp)
{
    const auto parsed = parse_log_line("May  1 12:00:00 parserd[77]: record table rebuilt");
    EXPECT_EQ(parsed.subsystem, "default");
    EXPECT_EQ(parsed.category, "default");
    EXPECT_EQ(parsed.message, "record table rebuilt");
}

TEST(ParseLogLine, TagInsideMessage)
{
    const auto parsed = parse_log_line("loading [net:tls] certificate chain");
    EXPECT_EQ(parsed.subsystem, "net");
    EXPECT_EQ(parsed.category, "tls");
    EXPECT_EQ(parsed.message, "loading  certificate chain");
}

TEST(MakeFormatString, Placeholders)
{
    EXPECT_EQ(make_format_string("Invalid header length 42 for record 0x1f"),
              "Invalid header length <num> for record <hex>");
    EXPECT_EQ(make_format_string("session 123e4567-e89b-12d3-a456-426614174000 closed after 1.5 s"),
              "session <uuid> closed after <num> s");
    EXPECT_EQ(make_format_string("Failed to open \"/tmp/x.db\": can't read"),
              "Failed to open <str>: can't read");
}

TEST(MakeFormatString, IdentifiersKeepTheirDigits)
{
    EXPECT_EQ(make_format_string("utf8 decoder sha256 mismatch"), "utf8 decoder sha256 mismatch");
    EXPECT_EQ(make_format_string("count=5 max=0x10"), "count=<num> max=<hex>");
    EXPECT_EQ(make_format_string("token 0xZZ"), "token 0xZZ");
}

TEST(MakeFormatString, WhitespaceCollapsed)
{
    EXPECT_EQ(make_format_string("  a \t  b  "), "a b");
    EXPECT_EQ(make_format_string(""), "");
}

TEST(LogTemplateExtractor, DedupesAndCountsInFirstSeenOrder)
{
    std::istringstream in(
        "[parser:io] Invalid header length 42\n"
        "[parser:io] record 7 accepted\n"
        "\n"
        "[parser:io] Invalid header length 4096\n"
        "[other:io] Invalid header length 1\n"
        "[parser:io] Invalid header length 9\n"
        "[parser:io] Invalid header length 10\n");
    const LogTemplateExtractor extractor(LogTemplateOptions{.max_samples = 2, .max_line_length = 4096});
    const auto templates = extractor.extract(in);

    ASSERT_EQ(templates.size(), 3U);
    EXPECT_EQ(templates[0].subsystem, "parser");
    EXPECT_EQ(templates[0].format_string, "Invalid header length <num>");
    EXPECT_EQ(templates[0].occurrences, 4U);
    EXPECT_EQ(templates[0].samples,
              (std::vector<std::string>{"Invalid header length 42", "Invalid header length 4096"}));
    EXPECT_EQ(templates[1].format_string, "record <num> accepted");
    EXPECT_EQ(templates[2].subsystem, "other");
    EXPECT_NE(templates[0].template_id, templates[2].template_id);
    EXPECT_EQ(templates[0].template_id,
              evidence::make_template_id("parser", "io", "Invalid header length <num>"));
}

TEST(LogTemplateExtractor, LongLinesAreCut)
{
    std::istringstream in(std::string(100, 'x') + " tail\n");
    const LogTemplateExtractor extractor(LogTemplateOptions{.max_samples = 3, .max_line_length = 10});
    const auto templates = extractor.extract(in);
    ASSERT_EQ(templates.size(), 1U);
    EXPECT_EQ(templates[0].format_string, std::string(10, 'x'));
}

TEST(LogTemplateExtractor, InvalidUtf8IsRepaired)
{
    std::istringstream in("bad byte \xFF here\n");
    const LogTemplateExtractor extractor;
    const auto templates = extractor.extract(in);
    ASSERT_EQ(templates.size(), 1U);
    EXPECT_EQ(templates[0].format_string, "bad byte ? here");
}

TEST(LogTemplateExtractor, DirectoryReadInSortedOrder)
{
    ossensor::test::TempDir dir("ossensor_logs_dir");
    ossensor::test::write_file(dir.path() / "b.log", "second file line\n");
    ossensor::test::write_file(dir.path() / "a/z.log", "first file line\n");
    ossensor::test::write_file(dir.path() / ".hidden.log", "hidden line\n");

    const LogTemplateExtractor extractor;
    auto templates = extractor.extract_path(dir.path());
    ASSERT_TRUE(templates) << templates.error().message;
    ASSERT_EQ(templates->size(), 2U);
    EXPECT_EQ((*templates)[0].format_string, "first file line");
    EXPECT_EQ((*templates)[1].format_string, "second file line");
}

TEST(LogTemplateExtractor, MissingFileIsIOError)
{
    const LogTemplateExtractor extractor;
    auto templates = extractor.extract_path("/nonexistent/ossensor/app.log");
    ASSERT_FALSE(templates);
    EXPECT_EQ(templates.error().code, "IOError");
}

}  // namespace ossensor::logs::test
