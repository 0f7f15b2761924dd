/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "constants/policies.hpp"

#include <gtest/gtest.h>

#include "common/hexutil.hpp"
#include "testutil/outcome.hpp"

using andamio::common::UnhexError;
using andamio::constants::assetNameToString;
using andamio::constants::isValidAssetName;
using andamio::constants::isValidPolicyId;
using andamio::constants::stringToAssetName;

constexpr auto kPolicyId{
    "4758613867a8a7aa500b5d57a0e877f01a8e63c1365469589b12063c"};

TEST(Policies, PolicyId) {
  EXPECT_TRUE(isValidPolicyId(kPolicyId));
  EXPECT_TRUE(isValidPolicyId(
      "4758613867A8A7AA500B5D57A0E877F01A8E63C1365469589B12063C"));
  EXPECT_FALSE(isValidPolicyId(
      "4758613867a8a7aa500b5d57a0e877f01a8e63c1365469589b12063"));
  EXPECT_FALSE(isValidPolicyId(
      "4758613867a8a7aa500b5d57a0e877f01a8e63c1365469589b12063cc"));
  EXPECT_FALSE(isValidPolicyId(
      "4758613867a8a7aa500b5d57a0e877f01a8e63c1365469589b12063x"));
  EXPECT_FALSE(isValidPolicyId(""));
}

TEST(Policies, AssetName) {
  EXPECT_TRUE(isValidAssetName(""));
  EXPECT_TRUE(isValidAssetName("616e6472616d696f"));
  EXPECT_TRUE(isValidAssetName(std::string(64, 'a')));
  EXPECT_FALSE(isValidAssetName(std::string(66, 'a')));
  EXPECT_FALSE(isValidAssetName("616"));
  EXPECT_FALSE(isValidAssetName("zz"));
}

/**
 * @given asset name text
 * @when converted to hex and back
 * @then text is restored, non-ASCII as UTF-8 bytes
 */
TEST(Policies, AssetNameText) {
  EXPECT_EQ(stringToAssetName("andamio"), "616e64616d696f");
  EXPECT_EQ(stringToAssetName(""), "");
  EXPECT_EQ(stringToAssetName("\xc3\xa9"), "c3a9");
  EXPECT_OUTCOME_EQ(assetNameToString("616E64616D696F"), "andamio");
  EXPECT_OUTCOME_EQ(assetNameToString(""), "");
  EXPECT_OUTCOME_ERROR(UnhexError::kNotEnoughInput, assetNameToString("616"));
  EXPECT_OUTCOME_ERROR(UnhexError::kNonHexInput, assetNameToString("6z"));
}
