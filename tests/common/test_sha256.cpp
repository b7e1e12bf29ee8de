/**
 * @file test_sha256.cpp
 * @brief SHA-256 and stable id tests
 */

#include "ossensor/common.hpp"

#include <string>

#include <gtest/gtest.h>

using namespace ossensor::common;

TEST(SHA256, KnownVectors)
{
    EXPECT_EQ(sha256(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(sha256("Hello, World!"), "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(SHA256, MultiBlockInput)
{
    // 56 bytes forces the length into a second padding block
    EXPECT_EQ(sha256("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq"),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256, PrefixedForm)
{
    const std::string hash = sha256_prefixed("artifact bytes");
    EXPECT_TRUE(hash.starts_with("sha256:"));
    EXPECT_EQ(hash.length(), 7 + 64);
    EXPECT_EQ(hash.substr(7), sha256("artifact bytes"));
}

TEST(StableId, KindPrefixAndLength)
{
    const std::string id = make_stable_id("hunk:", {"a.c", "1", "2"});
    EXPECT_TRUE(id.starts_with("hunk:"));
    EXPECT_EQ(id.length(), 5 + kStableDigestLength);
    EXPECT_EQ(id, make_stable_id("hunk:", {"a.c", "1", "2"}));
}

TEST(StableId, FieldBoundariesMatter)
{
    // The separator keeps adjacent fields from merging
    EXPECT_NE(short_digest({"ab", "c"}), short_digest({"a", "bc"}));
    EXPECT_NE(short_digest({"ab"}), short_digest({"a", "b"}));
}

TEST(StableId, PrefixDoesNotAffectDigest)
{
    const std::string hunk = make_stable_id("hunk:", {"x"});
    const std::string feat = make_stable_id("feat:", {"x"});
    EXPECT_NE(hunk, feat);
    EXPECT_EQ(hunk.substr(5), feat.substr(5));
}
