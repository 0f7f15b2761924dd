/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/hash_format.hpp"

#include <gtest/gtest.h>

#include "hashing/verification.hpp"
#include "testutil/literals.hpp"

using andamio::hashing::hashEquals;
using andamio::hashing::hashToHex;
using andamio::hashing::isValidHashFormat;
using andamio::hashing::verifyDetailed;

TEST(HashFormat, Equals) {
  EXPECT_TRUE(hashEquals("abCD", "ABcd"));
  EXPECT_FALSE(hashEquals("abcd", "abce"));
  EXPECT_FALSE(hashEquals("abcd", "abcd0"));
}

TEST(HashFormat, ToHex) {
  const auto hash{
      "0E5751C026E543B2E8AB2EB06099DAA1D1E5DF47778F7787FAAB45CDF12FE3A8"_hash256};
  EXPECT_EQ(
      hashToHex(hash),
      "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");
}

TEST(HashFormat, Valid) {
  EXPECT_TRUE(isValidHashFormat(std::string(64, 'F')));
  EXPECT_FALSE(isValidHashFormat(std::string(63, 'f')));
  EXPECT_FALSE(isValidHashFormat(std::string(64, 'g')));
}

/// Content is not hashed when expected hash is malformed
TEST(Verification, SkipsComputeOnInvalidFormat) {
  auto calls{0};
  const auto compute{[&] {
    ++calls;
    return std::string(64, 'a');
  }};
  const auto invalid{verifyDetailed("xyz", compute, {"ok", "bad"})};
  EXPECT_EQ(calls, 0);
  EXPECT_FALSE(invalid.valid);

  const auto valid{
      verifyDetailed(std::string(64, 'A'), compute, {"ok", "bad"})};
  EXPECT_EQ(calls, 1);
  EXPECT_TRUE(valid.valid);
  EXPECT_EQ(valid.expected_hash, std::string(64, 'a'));
  EXPECT_EQ(valid.message, "ok");

  const auto mismatch{
      verifyDetailed(std::string(64, 'b'), compute, {"ok", "bad"})};
  EXPECT_FALSE(mismatch.valid);
  EXPECT_EQ(mismatch.message, "bad");
}
