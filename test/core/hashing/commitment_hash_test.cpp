/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/commitment_hash.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

using andamio::codec::json::JsonError;
using andamio::codec::json::parse;
using andamio::hashing::computeCommitmentHash;
using andamio::hashing::isValidCommitmentHash;
using andamio::hashing::verifyCommitmentHash;
using andamio::hashing::verifyEvidenceDetailed;

constexpr auto kTiptap{
    R"({"type":"doc","content":[{"type":"paragraph",)"
    R"("content":[{"type":"text","text":"My submission"}]}]})"};
constexpr auto kTiptapHash{
    "75127e7f0c02f1e116d9e75c8442f0187af201e9866ac96b15ffdbaad0fa3db4"};

/**
 * @given Tiptap document
 * @when hashed as value and as text
 * @then both equal hash of its canonical JSON text
 */
TEST(CommitmentHash, KnownVector) {
  EXPECT_OUTCOME_TRUE(doc, parse(kTiptap));
  EXPECT_EQ(computeCommitmentHash(&doc), kTiptapHash);
  EXPECT_OUTCOME_EQ(computeCommitmentHash(std::string_view{kTiptap}),
                    kTiptapHash);
}

TEST(CommitmentHash, Normalized) {
  EXPECT_OUTCOME_EQ(
      computeCommitmentHash(std::string_view{
          R"({"b":"  padded  ","a":[1,null,true,{"z":1,"y":"  q"}]})"}),
      "80d520e9439f312a5a5f027711b83ddafeaf017fb8dfd41b287a04500f21188b");
}

/// Key order, formatting and padding do not change the hash
TEST(CommitmentHash, Equivalent) {
  EXPECT_OUTCOME_EQ(
      computeCommitmentHash(std::string_view{
          R"({ "content" : [ { "content" : [ { "text" : "  My submission ",)"
          R"( "type" : "text" } ], "type" : "paragraph" } ], "type":"doc" })"}),
      kTiptapHash);
}

/// Changed text changes the hash
TEST(CommitmentHash, ContentSensitive) {
  EXPECT_OUTCOME_TRUE(doc, parse(kTiptap));
  EXPECT_TRUE(verifyCommitmentHash(&doc, kTiptapHash));
  EXPECT_OUTCOME_TRUE(
      changed,
      parse(R"({"type":"doc","content":[{"type":"paragraph","content":)"
            R"([{"type":"text","text":"My submissio"}]}]})"));
  EXPECT_FALSE(verifyCommitmentHash(&changed, kTiptapHash));
}

TEST(CommitmentHash, ParseError) {
  EXPECT_OUTCOME_ERROR(JsonError::kParse,
                       computeCommitmentHash(std::string_view{"{\"type\":"}));
}

TEST(CommitmentHash, Format) {
  EXPECT_TRUE(isValidCommitmentHash(kTiptapHash));
  EXPECT_FALSE(isValidCommitmentHash("75127e7f"));
  EXPECT_FALSE(isValidCommitmentHash(
      "75127e7f0c02f1e116d9e75c8442f0187af201e9866ac96b15ffdbaad0fa3dbz"));
}

/// Matching evidence reports lowercase expected hash
TEST(EvidenceVerification, Match) {
  EXPECT_OUTCOME_TRUE(doc, parse(kTiptap));
  const auto result{verifyEvidenceDetailed(
      &doc, "75127E7F0C02F1E116D9E75C8442F0187AF201E9866AC96B15FFDBAAD0FA3DB4")};
  EXPECT_TRUE(result.valid);
  EXPECT_EQ(result.computed_hash, kTiptapHash);
  EXPECT_EQ(result.expected_hash, kTiptapHash);
  EXPECT_EQ(result.message, "Evidence matches on-chain commitment");
}

TEST(EvidenceVerification, Mismatch) {
  EXPECT_OUTCOME_TRUE(doc, parse(R"({"type":"doc"})"));
  const auto result{verifyEvidenceDetailed(&doc, kTiptapHash)};
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.computed_hash.size(), 64u);
  EXPECT_NE(result.computed_hash, kTiptapHash);
  EXPECT_EQ(result.expected_hash, kTiptapHash);
  EXPECT_EQ(result.message,
            "Evidence does not match on-chain commitment - content may have "
            "been modified");
}

/// Malformed on-chain hash is reported without hashing
TEST(EvidenceVerification, InvalidFormat) {
  EXPECT_OUTCOME_TRUE(doc, parse(kTiptap));
  const auto result{verifyEvidenceDetailed(&doc, "ABC")};
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.computed_hash, "");
  EXPECT_EQ(result.expected_hash, "ABC");
  EXPECT_EQ(result.message,
            "Invalid on-chain hash format: expected 64 hex characters, got "
            "\"ABC\"");
}

/// Deprecated names forward to commitment functions
TEST(CommitmentHash, DeprecatedAliases) {
  EXPECT_OUTCOME_TRUE(doc, parse(kTiptap));
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-declarations"
  EXPECT_EQ(andamio::hashing::computeAssignmentInfoHash(&doc), kTiptapHash);
  EXPECT_TRUE(andamio::hashing::verifyAssignmentInfoHash(&doc, kTiptapHash));
  EXPECT_TRUE(andamio::hashing::isValidAssignmentInfoHash(kTiptapHash));
#pragma GCC diagnostic pop
}
