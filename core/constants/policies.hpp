/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/outcome.hpp"

namespace andamio::constants {
  /// Hex length of minting policy id (blake2b-224 script hash)
  constexpr size_t kPolicyIdHexLength{56};
  /// Max hex length of asset name (32 bytes)
  constexpr size_t kAssetNameMaxHexLength{64};

  /// True if policy id is 56 hex characters of any case
  bool isValidPolicyId(std::string_view policy_id);

  /// True if asset name is even length hex of at most 64 characters
  bool isValidAssetName(std::string_view asset_name);

  /// Hex of UTF-8 bytes of string
  std::string stringToAssetName(std::string_view str);

  /**
   * Decodes hex asset name to string
   * @param hex - asset name hex of any case
   * @return string or UnhexError
   */
  outcome::result<std::string> assetNameToString(std::string_view hex);
}  // namespace andamio::constants
