/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace andamio::common {
  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError {
    kNotEnoughInput = 1,
    kNonHexInput,
  };

  /**
   * @brief Converts bytes to uppercase hex representation
   * @param bytes - input bytes
   * @return hex string
   */
  std::string hex_upper(BytesIn bytes);

  /**
   * @brief Converts bytes to lowercase hex representation
   * @param bytes - input bytes
   * @return hex string
   */
  std::string hex_lower(BytesIn bytes);

  /**
   * @brief Converts hex representation to bytes, accepts both cases
   * @param hex - hex string of even length
   * @return bytes or UnhexError
   */
  outcome::result<Bytes> unhex(std::string_view hex);

  /// True if every char is [0-9a-fA-F]
  bool isHex(std::string_view str);

  /// ASCII lowercase copy
  std::string toLowerAscii(std::string_view str);
}  // namespace andamio::common

OUTCOME_HPP_DECLARE_ERROR(andamio::common, UnhexError);
