/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/json/json.hpp"
#include "hashing/verification.hpp"

/**
 * Commitment hashing of assignment evidence.
 *
 * Evidence (usually Tiptap document) is normalized, formatted as
 * JSON.stringify text and hashed with blake2b-256, so the hash agrees with the
 * one stored on-chain by the web client.
 */
namespace andamio::hashing {
  using codec::json::JIn;
  using EvidenceVerificationResult = VerificationResult;

  /**
   * Computes commitment hash of evidence
   * @param evidence - any JSON value
   * @return 64 character lowercase hex hash
   */
  std::string computeCommitmentHash(JIn evidence);

  /**
   * Computes commitment hash of evidence JSON text
   * @return hash or JsonError::kParse
   */
  outcome::result<std::string> computeCommitmentHash(std::string_view json);

  /// Checks evidence against expected hash, case-insensitive
  bool verifyCommitmentHash(JIn evidence, std::string_view expected_hash);

  bool isValidCommitmentHash(std::string_view hash);

  /**
   * Verifies evidence against on-chain hash and explains the outcome
   * @param evidence - any JSON value
   * @param on_chain_hash - hash stored on-chain
   */
  EvidenceVerificationResult verifyEvidenceDetailed(
      JIn evidence, std::string_view on_chain_hash);

  [[deprecated("use computeCommitmentHash")]] inline std::string
  computeAssignmentInfoHash(JIn evidence) {
    return computeCommitmentHash(evidence);
  }

  [[deprecated("use verifyCommitmentHash")]] inline bool
  verifyAssignmentInfoHash(JIn evidence, std::string_view expected_hash) {
    return verifyCommitmentHash(evidence, expected_hash);
  }

  [[deprecated("use isValidCommitmentHash")]] inline bool
  isValidAssignmentInfoHash(std::string_view hash) {
    return isValidCommitmentHash(hash);
  }
}  // namespace andamio::hashing
