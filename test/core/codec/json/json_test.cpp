/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <limits>

#include "testutil/outcome.hpp"

using andamio::codec::json::format;
using andamio::codec::json::formatNumber;
using andamio::codec::json::jStrings;
using andamio::codec::json::JsonError;
using andamio::codec::json::parse;

namespace {
  /// Parses and formats back
  std::string reformat(std::string_view text) {
    auto doc{parse(text)};
    EXPECT_TRUE(doc) << text;
    return doc ? format(&doc.value()) : "";
  }
}  // namespace

/// Numbers are formatted as ECMAScript Number::toString
TEST(Json, NumberForm) {
  EXPECT_EQ(formatNumber(1.0), "1");
  EXPECT_EQ(formatNumber(-0.0), "0");
  EXPECT_EQ(formatNumber(0.5), "0.5");
  EXPECT_EQ(formatNumber(-1.25), "-1.25");
  EXPECT_EQ(formatNumber(0.1), "0.1");
  EXPECT_EQ(formatNumber(123456789.0), "123456789");
  EXPECT_EQ(formatNumber(1e20), "100000000000000000000");
  EXPECT_EQ(formatNumber(1e21), "1e+21");
  EXPECT_EQ(formatNumber(1.5e300), "1.5e+300");
  EXPECT_EQ(formatNumber(0.000001), "0.000001");
  EXPECT_EQ(formatNumber(1e-7), "1e-7");
  EXPECT_EQ(formatNumber(1.25e-7), "1.25e-7");
  EXPECT_EQ(formatNumber(std::numeric_limits<double>::infinity()), "null");
  EXPECT_EQ(formatNumber(std::nan("")), "null");
}

/**
 * @given JSON text with whitespace
 * @when parsed and formatted
 * @then output has no whitespace and keeps member order
 */
TEST(Json, Compact) {
  EXPECT_EQ(reformat(R"( { "b" : [ 1 , 2.5 , true , null ] , "a" : {} } )"),
            R"({"b":[1,2.5,true,null],"a":{}})");
  EXPECT_EQ(reformat("[]"), "[]");
  EXPECT_EQ(reformat("-12"), "-12");
  EXPECT_EQ(reformat("1.0"), "1");
  EXPECT_EQ(reformat("1E3"), "1000");
  EXPECT_EQ(reformat("18446744073709551615"), "18446744073709551615");
}

/// Minimal escaping: control characters, quote and backslash only
TEST(Json, StringEscape) {
  EXPECT_EQ(reformat(R"("a\"b\\c\/d")"), R"("a\"b\\c/d")");
  EXPECT_EQ(reformat(R"("\b\f\n\r\t")"), R"("\b\f\n\r\t")");
  EXPECT_EQ(reformat(R"("\u0001\u001F\u007f")"), "\"\\u0001\\u001f\x7f\"");
  // non-ASCII and line separators are kept as-is
  EXPECT_EQ(reformat("\"\xc3\xa9\xe2\x80\xa8\""),
            "\"\xc3\xa9\xe2\x80\xa8\"");
  EXPECT_EQ(reformat(R"({"k\n":1})"), R"({"k\n":1})");
}

TEST(Json, ParseError) {
  EXPECT_OUTCOME_ERROR(JsonError::kParse, parse("{"));
  EXPECT_OUTCOME_ERROR(JsonError::kParse, parse("[1,]"));
  EXPECT_OUTCOME_ERROR(JsonError::kParse, parse(""));
}

TEST(Json, Strings) {
  EXPECT_OUTCOME_TRUE(doc, parse(R"(["a", "", "b c"])"));
  EXPECT_OUTCOME_EQ(jStrings(&doc),
                    (std::vector<std::string>{"a", "", "b c"}));
  EXPECT_OUTCOME_TRUE(wrong, parse(R"(["a", 1])"));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, jStrings(&wrong));
  EXPECT_OUTCOME_TRUE(object, parse(R"({"a":"b"})"));
  EXPECT_OUTCOME_ERROR(JsonError::kWrongType, jStrings(&object));
}
