/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/commitment_hash.hpp"

#include "common/logger.hpp"
#include "common/span.hpp"
#include "hashing/canonical.hpp"

namespace andamio::hashing {
  namespace {
    common::Logger log() {
      static common::Logger logger{common::createLogger("commitment_hash")};
      return logger;
    }
  }  // namespace

  std::string computeCommitmentHash(JIn evidence) {
    const auto normalized{normalizeForHashing(evidence)};
    const auto text{codec::json::format(&normalized)};
    log()->trace("evidence: {}", text);
    return hashToHex(
        crypto::blake2b::blake2b_256(common::span::cbytes(text)));
  }

  outcome::result<std::string> computeCommitmentHash(std::string_view json) {
    OUTCOME_TRY(document, codec::json::parse(json));
    return computeCommitmentHash(&document);
  }

  bool verifyCommitmentHash(JIn evidence, std::string_view expected_hash) {
    const auto computed{computeCommitmentHash(evidence)};
    if (!hashEquals(computed, expected_hash)) {
      log()->warn("commitment mismatch: {} != {}", computed, expected_hash);
      return false;
    }
    return true;
  }

  bool isValidCommitmentHash(std::string_view hash) {
    return isValidHashFormat(hash);
  }

  EvidenceVerificationResult verifyEvidenceDetailed(
      JIn evidence, std::string_view on_chain_hash) {
    auto result{verifyDetailed(
        on_chain_hash,
        [&] { return computeCommitmentHash(evidence); },
        {
            "Evidence matches on-chain commitment",
            "Evidence does not match on-chain commitment - content may have "
            "been modified",
        })};
    if (!result.valid) {
      log()->warn("{}", result.message);
    }
    return result;
  }
}  // namespace andamio::hashing
