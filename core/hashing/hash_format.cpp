/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/hash_format.hpp"

#include <boost/algorithm/string/predicate.hpp>

namespace andamio::hashing {
  bool isValidHashFormat(std::string_view hash) {
    return hash.size() == kHashHexLength && common::isHex(hash);
  }

  bool hashEquals(std::string_view lhs, std::string_view rhs) {
    return boost::algorithm::iequals(lhs, rhs);
  }

  std::string hashToHex(const Blake2b256Hash &digest) {
    return digest.toHex();
  }
}  // namespace andamio::hashing
