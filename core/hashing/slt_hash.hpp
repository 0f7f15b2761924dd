/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

/**
 * Student learning target (SLT) hashing.
 *
 * Module token names are blake2b-256 of the learning targets encoded as
 * Plutus list of byte strings, matching on-chain
 * blake2b_256(serialiseData(slts)).
 */
namespace andamio::hashing {
  /**
   * Encodes learning targets as Plutus list of chunked byte strings
   * @param slts - learning target texts
   * @return pre-hash bytes
   */
  outcome::result<Bytes> encodeSlts(const std::vector<std::string> &slts);

  /**
   * Computes module token name of learning targets
   * @param slts - learning target texts
   * @return 64 character lowercase hex hash
   */
  outcome::result<std::string> computeSltHash(
      const std::vector<std::string> &slts);

  /// Alias of computeSltHash, strings are always chunked
  [[deprecated("use computeSltHash")]] inline outcome::result<std::string>
  computeSltHashDefinite(const std::vector<std::string> &slts) {
    return computeSltHash(slts);
  }

  /**
   * Checks whether learning targets match expected hash, case-insensitive
   * @param slts - learning target texts
   * @param expected_hash - hash to compare with
   */
  bool verifySltHash(const std::vector<std::string> &slts,
                     std::string_view expected_hash);

  /// True if hash is 64 hex characters
  bool isValidSltHash(std::string_view hash);
}  // namespace andamio::hashing
