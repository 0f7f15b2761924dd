/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "constants/policies.hpp"

#include "common/hexutil.hpp"
#include "common/span.hpp"

namespace andamio::constants {
  bool isValidPolicyId(std::string_view policy_id) {
    return policy_id.size() == kPolicyIdHexLength && common::isHex(policy_id);
  }

  bool isValidAssetName(std::string_view asset_name) {
    return asset_name.size() <= kAssetNameMaxHexLength
           && asset_name.size() % 2 == 0 && common::isHex(asset_name);
  }

  std::string stringToAssetName(std::string_view str) {
    return common::hex_lower(common::span::cbytes(str));
  }

  outcome::result<std::string> assetNameToString(std::string_view hex) {
    OUTCOME_TRY(bytes, common::unhex(hex));
    return std::string{common::span::bytestr(bytes)};
  }
}  // namespace andamio::constants
