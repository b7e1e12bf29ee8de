/**
 * @file test_triage.cpp
 * @brief Triage report construction, enrichment and output
 */

#include "ossensor/report/triage.hpp"

#include "ossensor/report.hpp"
#include "ossensor/schema_validate.hpp"
#include "ossensor/version.hpp"

#include "evidence_fixtures.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace ossensor::report::test {

using evidence::EvidenceRef;
using evidence::RefType;
using ossensor::test::TempDir;

namespace {

struct Scored
{
    bundle::EvidenceBundle bundle;
    scoring::ScoreResult score;
};

Scored score_inputs(bundle::BundleInputs inputs)
{
    auto bundle = bundle::EvidenceBundleAssembler{}.assemble(std::move(inputs));
    EXPECT_TRUE(bundle.has_value()) << bundle.error().message;
    auto score = scoring::ScoringEngine{}.score(*bundle);
    EXPECT_TRUE(score.has_value()) << score.error().message;
    return Scored{.bundle = std::move(*bundle), .score = std::move(*score)};
}

bool contains_line(const std::vector<std::string>& lines, const std::string& wanted)
{
    return std::ranges::find(lines, wanted) != lines.end();
}

}  // namespace

TEST(TriageReport, GuardFixReport)
{
    const auto scored = score_inputs(ossensor::test::guard_fix_inputs());
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    EXPECT_EQ(report->diff_id, scored.bundle.diff_id());
    EXPECT_TRUE(report->summary.starts_with("libparse 1.0 -> 1.1: score 1")) << report->summary;
    EXPECT_NE(report->summary.find("1 hunks, 1 source features, 0 log matches"), std::string::npos);

    ASSERT_EQ(report->explanation.size(), 1U);
    EXPECT_EQ(report->explanation.front(), "[+1] bounds-check-added: Bounds check added in src/parser.c line 7");
    EXPECT_EQ(report->citations, scored.score.reasons.front().evidence_refs());

    ASSERT_EQ(report->hypotheses.size(), 1U);
    const auto& hypothesis = report->hypotheses.front();
    EXPECT_TRUE(hypothesis.statement.starts_with("The check added at src/parser.c:7 rejects inputs that 1.0 accepted"))
        << hypothesis.statement;
    EXPECT_EQ(hypothesis.evidence_refs.back().type, RefType::kSourceFeature);
    EXPECT_FALSE(report->enrichment.has_value());
}

TEST(TriageReport, CitationsAreDeduplicatedInFirstSeenOrder)
{
    const auto scored = score_inputs(ossensor::test::source_inputs("", ossensor::test::kParserAfter));
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    // Every reason cites the one hunk; each feature is cited once
    ASSERT_EQ(report->citations.size(), 4U);
    EXPECT_EQ(report->citations[0].type, RefType::kDiffHunk);
    const auto hunks = std::ranges::count_if(report->citations, [](const EvidenceRef& ref) {
        return ref.type == RefType::kDiffHunk;
    });
    EXPECT_EQ(hunks, 1);
    EXPECT_EQ(report->explanation.size(), 3U);
    EXPECT_EQ(report->hypotheses.size(), 3U);
}

TEST(TriageReport, UnguardedAllocationHypothesis)
{
    const auto scored = score_inputs(ossensor::test::new_parser_inputs());
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    ASSERT_EQ(report->hypotheses.size(), 2U);
    const auto& statement = report->hypotheses.front().statement;
    EXPECT_TRUE(statement.starts_with("The size computation at src/parser.c:7 has no preceding bounds or overflow check"))
        << statement;
    EXPECT_TRUE(statement.ends_with("undersized allocation in 1.1.")) << statement;
}

TEST(TriageReport, RejectsScoreOfAnotherBundle)
{
    auto scored = score_inputs(ossensor::test::guard_fix_inputs());
    scored.score.diff_id = "diff:0000000000000000";

    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, "InvalidArgument");
}

TEST(TriageReport, RejectsScoreCitingUnknownEvidence)
{
    auto scored = score_inputs(ossensor::test::guard_fix_inputs());
    auto stray = scoring::Reason::make(
        "import-added",
        "Import memcpy added in 1.1",
        0.3,
        {EvidenceRef{.type = RefType::kBinaryImport, .artifact_id = "bin:1.1/libparse", .stable_id = "imp:memcpy"}});
    ASSERT_TRUE(stray.has_value());
    scored.score.reasons.push_back(std::move(*stray));

    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_FALSE(report.has_value());
    EXPECT_EQ(report.error().code, "DanglingReference");
}

TEST(TriageReport, EnrichmentMustCiteBundleEvidence)
{
    const auto scored = score_inputs(ossensor::test::full_inputs());
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value()) << report.error().message;

    const nlohmann::json dangling = {
        {"narrative", "abort() is reached when the entry count overflows"},
        {"evidence_refs", {{{"ref_type", "binary_import"}, {"stable_id", "imp:exit"}}}},
    };
    auto rejected = attach_enrichment(*report, scored.bundle, dangling);
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, "DanglingReference");
    EXPECT_FALSE(report->enrichment.has_value());

    auto not_object = attach_enrichment(*report, scored.bundle, nlohmann::json::array());
    ASSERT_FALSE(not_object.has_value());
    EXPECT_EQ(not_object.error().code, "InvalidArgument");

    const nlohmann::json grounded = {
        {"narrative", "abort() is reached when the entry count overflows"},
        {"evidence_refs", {{{"ref_type", "binary_import"}, {"stable_id", "imp:abort"}}}},
    };
    auto accepted = attach_enrichment(*report, scored.bundle, grounded);
    ASSERT_TRUE(accepted.has_value()) << accepted.error().message;
    ASSERT_TRUE(report->enrichment.has_value());

    const nlohmann::json doc = to_json(*report);
    EXPECT_EQ(doc.at("enrichment"), grounded);
    EXPECT_TRUE(enforce_citation_policy(scored.bundle, doc).has_value());
}

TEST(TriageReport, JsonMatchesSchema)
{
    const auto scored = score_inputs(ossensor::test::full_inputs());
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value());

    const nlohmann::json doc = to_json(*report);
    EXPECT_EQ(doc.at("schema_version"), kTriageSchemaVersion);
    EXPECT_EQ(doc.at("citations").size(), 8U);
    EXPECT_FALSE(doc.contains("enrichment"));
    auto valid = common::validate_json_version(doc, ossensor::test::schema_dir(), kTriageSchemaVersion);
    EXPECT_TRUE(valid.has_value()) << valid.error().message;
}

TEST(TriageReport, TextRendering)
{
    const auto scored = score_inputs(ossensor::test::guard_fix_inputs());
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value());

    const auto lines = render_text(*report, scored.score);
    ASSERT_GE(lines.size(), 4U);
    EXPECT_EQ(lines[0], "TRIAGE: " + scored.bundle.diff_id());
    EXPECT_EQ(lines[2], "  ruleset: rules.v1");
    EXPECT_TRUE(contains_line(lines, "REASONS:"));
    EXPECT_TRUE(contains_line(lines, "HYPOTHESES:"));
    EXPECT_TRUE(contains_line(lines, "    - diff_hunk " + scored.bundle.diff_hunks().front().hunk_id));
    EXPECT_FALSE(contains_line(lines, "ENRICHMENT: accepted (all citations resolve)"));
}

TEST(TriageReport, TextRenderingWithoutReasons)
{
    bundle::BundleInputs inputs;
    inputs.build_from = "1.0";
    inputs.build_to = "1.1";
    inputs.component = "libparse";
    const auto scored = score_inputs(std::move(inputs));
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value());

    const auto lines = render_text(*report, scored.score);
    EXPECT_TRUE(contains_line(lines, "  no scoring rule matched"));
    EXPECT_FALSE(contains_line(lines, "HYPOTHESES:"));
}

TEST(TriageReport, WritesJsonAndText)
{
    TempDir dir("ossensor_triage");
    const auto scored = score_inputs(ossensor::test::full_inputs());
    auto report = build_triage_report(scored.bundle, scored.score);
    ASSERT_TRUE(report.has_value());

    const auto json_path = dir.path() / "triage.json";
    auto written = write_triage_report(*report, scored.score, TriageFormat::kJson, json_path,
                                       ossensor::test::schema_dir());
    ASSERT_TRUE(written.has_value()) << written.error().message;
    const std::string json_text = ossensor::test::read_file(json_path);
    EXPECT_TRUE(json_text.ends_with("\n"));
    EXPECT_EQ(nlohmann::json::parse(json_text), to_json(*report));

    const auto text_path = dir.path() / "triage.txt";
    written = write_triage_report(*report, scored.score, TriageFormat::kText, text_path,
                                  ossensor::test::schema_dir());
    ASSERT_TRUE(written.has_value()) << written.error().message;
    std::ostringstream expected;
    for (const auto& line : render_text(*report, scored.score)) {
        expected << line << "\n";
    }
    EXPECT_EQ(ossensor::test::read_file(text_path), expected.str());

    auto unwritable = write_triage_report(*report, scored.score, TriageFormat::kText,
                                          dir.path() / "missing" / "triage.txt", ossensor::test::schema_dir());
    ASSERT_FALSE(unwritable.has_value());
    EXPECT_EQ(unwritable.error().code, "IOError");
}

}  // namespace ossensor::report::test
