/**
 * @file test_cli.cpp
 * @brief ossensor diff / score / report driven through the installed binary
 */

#include "ossensor/bundle.hpp"
#include "ossensor/schema_validate.hpp"
#include "ossensor/scoring.hpp"
#include "ossensor/version.hpp"

#include "binary_images.hpp"
#include "test_support.hpp"

#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

namespace ossensor::cli::test {

using ossensor::test::read_file;
using ossensor::test::TempDir;
using ossensor::test::write_bytes;
using ossensor::test::write_file;

namespace {

std::string quoted(const std::filesystem::path& path)
{
    return "'" + path.string() + "'";
}

int run_cli(const std::string& arguments)
{
    const std::string command = std::string("'") + OSSENSOR_CLI_PATH + "' " + arguments;
    return std::system(command.c_str());
}

class CliFixture : public ::testing::Test
{
protected:
    CliFixture()
        : m_dir("ossensor_cli")
    {
        write_file(root() / "from/src/parser.c", ossensor::test::kParserBefore);
        write_file(root() / "to/src/parser.c", ossensor::test::kParserAfter);
        write_bytes(root() / "libparse-1.0.so",
                    ossensor::test::make_elf64({{"load_entries", 0x1000}}, {"libc.so.6"}, "GLIBC_2.2.5"));
        write_bytes(root() / "libparse-1.1.so",
                    ossensor::test::make_elf64({{"load_entries", 0x1040}, {"check_count", 0x1100}},
                                               {"libc.so.6", "libz.so.1"},
                                               "entry count overflows table: %u"));
        write_file(root() / "parserd.log",
                   "2024-05-01T12:00:00Z host parserd[42]: [parser:io] entry count overflows table: 70000\n");
    }

    [[nodiscard]] const std::filesystem::path& root() const { return m_dir.path(); }

    [[nodiscard]] std::string schema_arg() const
    {
        return " --schema-dir " + test::quoted(ossensor::test::schema_dir());
    }

    [[nodiscard]] std::string diff_args() const
    {
        return "diff --build-from 1.0 --build-to 1.1 --component libparse"
               " --source-from " + quoted(root() / "from") + " --source-to " + quoted(root() / "to")
               + " --binary-from " + quoted(root() / "libparse-1.0.so") + " --binary-to "
               + quoted(root() / "libparse-1.1.so") + " --log " + quoted(root() / "parserd.log") + schema_arg()
               + " --quiet";
    }

private:
    TempDir m_dir;
};

}  // namespace

TEST(Cli, VersionAndHelp)
{
    EXPECT_EQ(run_cli("version > /dev/null"), 0);
    EXPECT_EQ(run_cli("--help > /dev/null"), 0);
    EXPECT_NE(run_cli("frobnicate > /dev/null 2>&1"), 0);
}

TEST_F(CliFixture, DiffScoreReport)
{
    const auto bundle_path = root() / "out" / "bundle.json";
    std::filesystem::create_directories(bundle_path.parent_path());
    ASSERT_EQ(run_cli(diff_args() + " --jobs 2 -o " + quoted(bundle_path) + " > /dev/null"), 0);

    auto bundle = bundle::read_bundle_file(bundle_path, ossensor::test::schema_dir());
    ASSERT_TRUE(bundle.has_value()) << bundle.error().message;
    EXPECT_EQ(bundle->component(), "libparse");
    EXPECT_EQ(bundle->source_features().size(), 1U);
    EXPECT_FALSE(bundle->log_to_binary_matches().empty());

    const auto score_path = root() / "out" / "score.json";
    ASSERT_EQ(run_cli("score --bundle " + quoted(bundle_path) + " -o " + quoted(score_path) + schema_arg()
                      + " --quiet > /dev/null"),
              0);
    auto score_doc = common::read_json_file(score_path);
    ASSERT_TRUE(score_doc.has_value()) << score_doc.error().message;
    EXPECT_EQ(score_doc->at("diff_id"), bundle->diff_id());
    EXPECT_EQ(score_doc->at("ruleset_version"), kRulesetVersion);
    auto score = scoring::score_result_from_json(*score_doc);
    ASSERT_TRUE(score.has_value()) << score.error().message;
    EXPECT_GT(score->total_score, 0.0);

    const auto report_path = root() / "out" / "triage.json";
    ASSERT_EQ(run_cli("report --bundle " + quoted(bundle_path) + " --score " + quoted(score_path)
                      + " --format json -o " + quoted(report_path) + schema_arg() + " --quiet > /dev/null"),
              0);
    auto report_doc = common::read_json_file(report_path);
    ASSERT_TRUE(report_doc.has_value()) << report_doc.error().message;
    EXPECT_EQ(report_doc->at("diff_id"), bundle->diff_id());
    auto valid = common::validate_json_version(*report_doc, ossensor::test::schema_dir(), kTriageSchemaVersion);
    EXPECT_TRUE(valid.has_value()) << valid.error().message;

    const auto text_path = root() / "out" / "triage.txt";
    ASSERT_EQ(run_cli("report --bundle " + quoted(bundle_path) + " --score " + quoted(score_path) + schema_arg()
                      + " --quiet > " + quoted(text_path)),
              0);
    const std::string text = read_file(text_path);
    EXPECT_TRUE(text.starts_with("TRIAGE: " + bundle->diff_id() + "\n"));
    EXPECT_NE(text.find("bounds-check-added"), std::string::npos);
}

TEST_F(CliFixture, ConfigWeightsApplyToScore)
{
    const auto bundle_path = root() / "bundle.json";
    ASSERT_EQ(run_cli(diff_args() + " -o " + quoted(bundle_path) + " > /dev/null"), 0);

    const auto config_path = root() / "config.json";
    write_file(config_path, R"({"schema_version": "config.v1", "scoring": {"weights": {"import-added": 7.0}}})");
    const auto score_path = root() / "score.json";
    ASSERT_EQ(run_cli("score --bundle " + quoted(bundle_path) + " --config " + quoted(config_path) + " -o "
                      + quoted(score_path) + schema_arg() + " --quiet > /dev/null"),
              0);

    auto score_doc = common::read_json_file(score_path);
    ASSERT_TRUE(score_doc.has_value());
    EXPECT_DOUBLE_EQ(score_doc->at("weights").at("import-added").get<double>(), 7.0);
    bool import_reason = false;
    for (const auto& reason : score_doc->at("reasons")) {
        if (reason.at("rule_id") == "import-added") {
            import_reason = true;
            EXPECT_DOUBLE_EQ(reason.at("score_contribution").get<double>(), 7.0);
        }
    }
    EXPECT_TRUE(import_reason);
}

TEST_F(CliFixture, RejectsBadInvocations)
{
    EXPECT_NE(run_cli("diff --build-from 1.0 --build-to 1.1 > /dev/null 2>&1"), 0);
    EXPECT_NE(run_cli("diff --jobs 0 --build-from 1.0 --build-to 1.1 --component libparse > /dev/null 2>&1"), 0);
    EXPECT_NE(run_cli("score" + schema_arg() + " > /dev/null 2>&1"), 0);
    EXPECT_NE(run_cli("report --bundle " + quoted(root() / "absent.json") + " --score "
                      + quoted(root() / "absent.json") + schema_arg() + " --quiet > /dev/null 2>&1"),
              0);
    EXPECT_NE(run_cli("report --bundle x --score y --format yaml > /dev/null 2>&1"), 0);
}

TEST_F(CliFixture, ReportRejectsUngroundedEnrichment)
{
    const auto bundle_path = root() / "bundle.json";
    const auto score_path = root() / "score.json";
    ASSERT_EQ(run_cli(diff_args() + " -o " + quoted(bundle_path) + " > /dev/null"), 0);
    ASSERT_EQ(run_cli("score --bundle " + quoted(bundle_path) + " -o " + quoted(score_path) + schema_arg()
                      + " --quiet > /dev/null"),
              0);

    const auto enrichment_path = root() / "enrichment.json";
    write_file(enrichment_path,
               R"({"claims": [{"text": "heap overflow", "evidence_refs": [{"ref_type": "diff_hunk", "stable_id": "hunk:0000000000000000"}]}]})");
    EXPECT_NE(run_cli("report --bundle " + quoted(bundle_path) + " --score " + quoted(score_path)
                      + " --enrichment " + quoted(enrichment_path) + schema_arg() + " --quiet > /dev/null 2>&1"),
              0);

    write_file(enrichment_path,
               R"({"claims": [{"text": "new dependency", "evidence_refs": [{"ref_type": "binary_import", "stable_id": "imp:libz.so.1"}]}]})");
    EXPECT_EQ(run_cli("report --bundle " + quoted(bundle_path) + " --score " + quoted(score_path)
                      + " --enrichment " + quoted(enrichment_path) + schema_arg() + " --quiet > /dev/null"),
              0);
}

}  // namespace ossensor::cli::test
