/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/json/json.hpp"

namespace andamio::hashing {
  using codec::json::Document;
  using codec::json::JIn;

  /**
   * Normalizes a value for consistent hashing.
   *
   * Normalization rules:
   * - Objects: members sorted by key bytes, duplicate keys keep the last
   *   value, values normalized recursively
   * - Arrays: order preserved, items normalized recursively
   * - Strings: ECMAScript whitespace trimmed from both ends
   * - Numbers, booleans, null: kept as-is
   *
   * @param value - any JSON value
   * @return normalized deep copy
   */
  Document normalizeForHashing(JIn value);

  /**
   * Trims ECMAScript white space and line terminators from both ends of UTF-8
   * string, the way String.prototype.trim does
   */
  std::string_view trimWhitespace(std::string_view str);
}  // namespace andamio::hashing
