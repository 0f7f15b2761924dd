/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "hashing/hash_format.hpp"

namespace andamio::hashing {
  /**
   * Result of comparing content with an on-chain hash
   */
  struct VerificationResult {
    /// Whether the content matches the on-chain hash
    bool valid{};
    /// The hash computed from the content, empty if expected hash is invalid
    std::string computed_hash;
    /// The expected hash, lowercase if its format is valid
    std::string expected_hash;
    /// Human-readable status message
    std::string message;
  };

  /// Messages reported by verifyDetailed on match and on mismatch
  struct VerificationMessages {
    std::string_view match;
    std::string_view mismatch;
  };

  /**
   * Validates expected hash format, then computes hash and compares.
   * @param expected_hash - hash from on-chain data, any case
   * @param compute - returns lowercase hex hash of content
   * @param messages - status messages
   */
  template <typename F>
  VerificationResult verifyDetailed(std::string_view expected_hash,
                                    const F &compute,
                                    const VerificationMessages &messages) {
    if (!isValidHashFormat(expected_hash)) {
      return {
          false,
          "",
          std::string{expected_hash},
          fmt::format("Invalid on-chain hash format: expected {} hex "
                      "characters, got \"{}\"",
                      kHashHexLength,
                      expected_hash),
      };
    }
    std::string computed_hash{compute()};
    const auto valid{hashEquals(computed_hash, expected_hash)};
    return {
        valid,
        std::move(computed_hash),
        common::toLowerAscii(expected_hash),
        std::string{valid ? messages.match : messages.mismatch},
    };
  }
}  // namespace andamio::hashing
