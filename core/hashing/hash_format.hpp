/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include "common/hexutil.hpp"
#include "crypto/blake2/blake2b256.hpp"

namespace andamio::hashing {
  using crypto::blake2b::Blake2b256Hash;

  /// Hex length of blake2b-256 digest
  constexpr size_t kHashHexLength{2 * crypto::blake2b::kBlake2b256HashLength};

  /// True if hash is 64 hex characters of any case
  bool isValidHashFormat(std::string_view hash);

  /// Compares hex hashes ignoring ASCII case
  bool hashEquals(std::string_view lhs, std::string_view rhs);

  /// Lowercase hex of digest
  std::string hashToHex(const Blake2b256Hash &digest);
}  // namespace andamio::hashing
