/**
 * @file test_citation_policy.cpp
 * @brief Citation checks over arbitrary report documents
 */

#include "ossensor/report.hpp"

#include "evidence_fixtures.hpp"

#include <string>

#include <gtest/gtest.h>

namespace ossensor::report::test {

namespace {

bundle::EvidenceBundle full_bundle()
{
    auto bundle = bundle::EvidenceBundleAssembler{}.assemble(ossensor::test::full_inputs());
    EXPECT_TRUE(bundle.has_value()) << bundle.error().message;
    return std::move(*bundle);
}

}  // namespace

TEST(CitationPolicy, AcceptsResolvableCitationsAtAnyDepth)
{
    const auto bundle = full_bundle();
    const std::string hunk_id = bundle.diff_hunks().front().hunk_id;
    const nlohmann::json doc = {
        {"verdict", "likely fix"},
        {"citations", {{{"ref_type", "diff_hunk"}, {"stable_id", hunk_id}}}},
        {"findings",
         {{{"title", "new import"},
           {"evidence_refs",
            {{{"ref_type", "binary_import"}, {"artifact_id", "bin:1.1/libparse"}, {"stable_id", "imp:abort"}}}}}}},
    };
    auto result = enforce_citation_policy(bundle, doc);
    EXPECT_TRUE(result.has_value()) << result.error().message;
}

TEST(CitationPolicy, IgnoresFieldsThatAreNotCitations)
{
    const auto bundle = full_bundle();
    const nlohmann::json doc = {
        {"notes", {{{"ref_type", "diff_hunk"}, {"stable_id", "hunk:0000000000000000"}}}},
        {"stable_id", "not a citation"},
    };
    EXPECT_TRUE(enforce_citation_policy(bundle, doc).has_value());
    EXPECT_TRUE(enforce_citation_policy(bundle, nlohmann::json::object()).has_value());
}

TEST(CitationPolicy, RejectsDanglingCitation)
{
    const auto bundle = full_bundle();
    const nlohmann::json doc = {
        {"findings",
         {{{"evidence_refs", nlohmann::json::array()}},
          {{"evidence_refs",
            {{{"ref_type", "binary_import"}, {"artifact_id", "bin:1.0/libparse"}, {"stable_id", "imp:abort"}}}}}}},
    };
    auto result = enforce_citation_policy(bundle, doc);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, "DanglingReference");
    EXPECT_NE(result.error().message.find("/findings/1/evidence_refs[0]"), std::string::npos);
    EXPECT_NE(result.error().message.find("imp:abort"), std::string::npos);
}

TEST(CitationPolicy, RejectsMalformedCitations)
{
    const auto bundle = full_bundle();

    auto unknown_type = enforce_citation_policy(
        bundle, {{"citations", {{{"ref_type", "source_line"}, {"stable_id", "hunk:0000000000000000"}}}}});
    ASSERT_FALSE(unknown_type.has_value());
    EXPECT_EQ(unknown_type.error().code, "ParseError");

    auto missing_id = enforce_citation_policy(bundle, {{"citations", {{{"ref_type", "diff_hunk"}}}}});
    ASSERT_FALSE(missing_id.has_value());
    EXPECT_EQ(missing_id.error().code, "ParseError");

    auto not_array = enforce_citation_policy(bundle, {{"citations", "diff_hunk"}});
    ASSERT_FALSE(not_array.has_value());
    EXPECT_EQ(not_array.error().code, "ParseError");
}

}  // namespace ossensor::report::test
