/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/slt_hash.hpp"

#include "codec/plutus/plutus.hpp"
#include "common/logger.hpp"
#include "hashing/hash_format.hpp"

namespace andamio::hashing {
  namespace {
    common::Logger log() {
      static common::Logger logger{common::createLogger("slt_hash")};
      return logger;
    }
  }  // namespace

  outcome::result<Bytes> encodeSlts(const std::vector<std::string> &slts) {
    return codec::plutus::encode(slts);
  }

  outcome::result<std::string> computeSltHash(
      const std::vector<std::string> &slts) {
    OUTCOME_TRY(encoded, encodeSlts(slts));
    if (log()->should_log(spdlog::level::trace)) {
      log()->trace("slts ({}): {}", slts.size(), common::hex_lower(encoded));
    }
    return hashToHex(crypto::blake2b::blake2b_256(encoded));
  }

  bool verifySltHash(const std::vector<std::string> &slts,
                     std::string_view expected_hash) {
    auto computed{computeSltHash(slts)};
    if (!computed) {
      log()->warn("slt hash failed: {}", computed.error().message());
      return false;
    }
    if (!hashEquals(computed.value(), expected_hash)) {
      log()->warn(
          "slt hash mismatch: {} != {}", computed.value(), expected_hash);
      return false;
    }
    return true;
  }

  bool isValidSltHash(std::string_view hash) {
    return isValidHashFormat(hash);
  }
}  // namespace andamio::hashing
