/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <rapidjson/document.h>

#include <string>
#include <string_view>
#include <vector>

#include "codec/json/json_errors.hpp"

namespace andamio::codec::json {
  using rapidjson::Document;
  using rapidjson::Value;
  using JIn = const Value *;

  /// Parses JSON text, numbers are parsed with full precision
  outcome::result<Document> parse(std::string_view input);

  /**
   * Formats value the way ECMAScript JSON.stringify does: no whitespace,
   * members in stored order, minimal string escaping, shortest round-trip
   * numbers, non-finite numbers as null
   */
  std::string format(JIn j);

  /// Formats number as ECMAScript Number::toString
  std::string formatNumber(double value);

  /// Decodes array of strings
  outcome::result<std::vector<std::string>> jStrings(JIn j);
}  // namespace andamio::codec::json
