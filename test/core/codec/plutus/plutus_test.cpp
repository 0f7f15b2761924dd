/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/plutus/plutus.hpp"

#include <gtest/gtest.h>
#include <limits>

#include "testutil/literals.hpp"
#include "testutil/outcome.hpp"

using andamio::Bytes;
using andamio::codec::plutus::encode;
using andamio::codec::plutus::encodeByteString;
using andamio::codec::plutus::encodeChunkedByteString;
using andamio::codec::plutus::encodeConstr;
using andamio::codec::plutus::encodeInteger;
using andamio::codec::plutus::encodeList;
using andamio::codec::plutus::PlutusEncodeError;
using andamio::codec::plutus::PlutusEncodeStream;
using andamio::primitives::BigInt;

namespace {
  Bytes repeat(size_t n, uint8_t byte = 0xAB) {
    return Bytes(n, byte);
  }

  Bytes concat(std::initializer_list<Bytes> parts) {
    Bytes result;
    for (const auto &part : parts) {
      andamio::append(result, part);
    }
    return result;
  }
}  // namespace

/**
 * @given integers on both sides of each width boundary
 * @when encoded
 * @then shortest head is used
 */
TEST(Plutus, IntegerWidth) {
  EXPECT_EQ(encodeInteger(0), "00"_unhex);
  EXPECT_EQ(encodeInteger(23), "17"_unhex);
  EXPECT_EQ(encodeInteger(24), "1818"_unhex);
  EXPECT_EQ(encodeInteger(255), "18ff"_unhex);
  EXPECT_EQ(encodeInteger(256), "190100"_unhex);
  EXPECT_EQ(encodeInteger(65535), "19ffff"_unhex);
  EXPECT_EQ(encodeInteger(65536), "1a00010000"_unhex);
  EXPECT_EQ(encodeInteger(int64_t{4294967295}), "1affffffff"_unhex);
  EXPECT_EQ(encodeInteger(int64_t{4294967296}), "1b0000000100000000"_unhex);
  EXPECT_EQ(encodeInteger(std::numeric_limits<uint64_t>::max()),
            "1bffffffffffffffff"_unhex);
  EXPECT_EQ(encodeInteger(int64_t{1769027280000}), "1b0000019be23e1c80"_unhex);
}

/// Negative n is encoded as -1-n under major type 1
TEST(Plutus, NegativeInteger) {
  EXPECT_EQ(encodeInteger(-1), "20"_unhex);
  EXPECT_EQ(encodeInteger(-24), "37"_unhex);
  EXPECT_EQ(encodeInteger(-25), "3818"_unhex);
  EXPECT_EQ(encodeInteger(-256), "38ff"_unhex);
  EXPECT_EQ(encodeInteger(-257), "390100"_unhex);
  EXPECT_EQ(encodeInteger(std::numeric_limits<int64_t>::min()),
            "3b7fffffffffffffff"_unhex);
}

/**
 * @given integers of arbitrary precision
 * @when encoded
 * @then 64-bit range uses plain heads, wider values use bignum tags
 */
TEST(Plutus, BigInteger) {
  const BigInt two64{BigInt{1} << 64};
  EXPECT_EQ(encodeInteger(BigInt{5}), "05"_unhex);
  EXPECT_EQ(encodeInteger(BigInt{-5}), "24"_unhex);
  EXPECT_EQ(encodeInteger(BigInt{1769027280000}), "1b0000019be23e1c80"_unhex);
  EXPECT_EQ(encodeInteger(two64 - 1), "1bffffffffffffffff"_unhex);
  EXPECT_EQ(encodeInteger(BigInt{-two64}), "3bffffffffffffffff"_unhex);
  EXPECT_EQ(encodeInteger(two64), "c249010000000000000000"_unhex);
  EXPECT_EQ(encodeInteger(BigInt{-two64 - 1}), "c349010000000000000000"_unhex);
}

/// Byte string length heads
TEST(Plutus, ByteString) {
  EXPECT_OUTCOME_EQ(encodeByteString({}), "40"_unhex);
  EXPECT_OUTCOME_EQ(encodeByteString("cafe"_unhex), "42cafe"_unhex);
  EXPECT_OUTCOME_EQ(encodeByteString(repeat(23)),
                    concat({"57"_unhex, repeat(23)}));
  EXPECT_OUTCOME_EQ(encodeByteString(repeat(24)),
                    concat({"5818"_unhex, repeat(24)}));
  EXPECT_OUTCOME_EQ(encodeByteString(repeat(255)),
                    concat({"58ff"_unhex, repeat(255)}));
  EXPECT_OUTCOME_EQ(encodeByteString(repeat(256)),
                    concat({"590100"_unhex, repeat(256)}));
  EXPECT_OUTCOME_EQ(encodeByteString(repeat(65535)),
                    concat({"59ffff"_unhex, repeat(65535)}));
}

/// Byte string over 65535 bytes is rejected
TEST(Plutus, ByteStringTooLarge) {
  EXPECT_OUTCOME_ERROR(PlutusEncodeError::kByteStringTooLarge,
                       encodeByteString(repeat(65536)));
}

/**
 * @given payloads of 64 and 65 bytes
 * @when chunked
 * @then 64 bytes is single definite string, 65 bytes is two chunks
 */
TEST(Plutus, ChunkBoundary) {
  EXPECT_EQ(encodeChunkedByteString(repeat(64)),
            concat({"5840"_unhex, repeat(64)}));
  EXPECT_EQ(encodeChunkedByteString(repeat(65)),
            concat({"5f5840"_unhex,
                    repeat(64),
                    "41"_unhex,
                    repeat(1),
                    "ff"_unhex}));
  EXPECT_EQ(encodeChunkedByteString(repeat(128)),
            concat({"5f5840"_unhex,
                    repeat(64),
                    "5840"_unhex,
                    repeat(64),
                    "ff"_unhex}));
  EXPECT_EQ(encodeChunkedByteString({}), "40"_unhex);
}

/// Chunked string of any length never fails
TEST(Plutus, ChunkedLarge) {
  const auto encoded{encodeChunkedByteString(repeat(70000))};
  EXPECT_EQ(encoded.front(), 0x5f);
  EXPECT_EQ(encoded.back(), 0xff);
  // 1093 chunks of 2 + 64 bytes, last chunk of 2 + 48 bytes
  EXPECT_EQ(encoded.size(), size_t{1 + 1093 * 66 + 50 + 1});
}

/// Lists are indefinite except the empty one
TEST(Plutus, List) {
  EXPECT_EQ(encodeList({}), "80"_unhex);
  const std::vector<Bytes> items{"01"_unhex, "4161"_unhex};
  EXPECT_EQ(encodeList(items), "9f014161ff"_unhex);
}

/**
 * @given constructor alternatives
 * @when encoded
 * @then compact tags 121-127 and 1280-1400 are used, tag 102 otherwise
 */
TEST(Plutus, Constr) {
  const std::vector<Bytes> fields{"01"_unhex, "02"_unhex};
  EXPECT_EQ(encodeConstr(fields), "d8799f0102ff"_unhex);
  EXPECT_EQ(encodeConstr({}), "d87980"_unhex);
  EXPECT_EQ(encodeConstr(6, {}), "d87f80"_unhex);
  EXPECT_EQ(encodeConstr(7, {}), "d9050080"_unhex);
  EXPECT_EQ(encodeConstr(127, {}), "d9057880"_unhex);
  EXPECT_EQ(encodeConstr(128, fields), "d8668218809f0102ff"_unhex);
}

/// Stream composes strings, lists and tuples
TEST(Plutus, Stream) {
  EXPECT_OUTCOME_EQ(encode(std::string{"hello"}), "4568656c6c6f"_unhex);
  EXPECT_OUTCOME_EQ(encode(std::vector<std::string>{}), "80"_unhex);
  EXPECT_OUTCOME_EQ(encode(std::vector<std::string>{"a", ""}),
                    "9f416140ff"_unhex);

  auto pair{PlutusEncodeStream::tuple()};
  pair << "a" << 5;
  EXPECT_EQ(pair.data(), "82416105"_unhex);
  EXPECT_EQ(pair.count(), 2u);

  auto constr{PlutusEncodeStream::constr(0)};
  constr << std::vector<int64_t>{1, 2} << pair;
  EXPECT_EQ(constr.data(), "d8799f9f0102ff82416105ff"_unhex);
}
