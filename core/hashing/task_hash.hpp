/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include "codec/plutus/plutus_encode_stream.hpp"
#include "common/outcome.hpp"

namespace andamio::hashing {
  using codec::plutus::PlutusEncodeStream;

  /// Native asset amount attached to task reward
  struct NativeAsset {
    /// "policyId.assetName", encoded as its UTF-8 text
    std::string asset_class;
    int64_t quantity{};
  };

  /**
   * Project task, field order is the on-chain field order
   */
  struct TaskData {
    /// Task description, up to 140 characters recommended
    std::string content;
    /// Expiration as POSIX time in milliseconds
    int64_t expiration{};
    /// Reward in lovelace
    int64_t lovelace{};
    std::vector<NativeAsset> native_assets;
  };

  inline bool operator==(const NativeAsset &lhs, const NativeAsset &rhs) {
    return lhs.asset_class == rhs.asset_class && lhs.quantity == rhs.quantity;
  }

  /// Encodes asset as [asset_class, quantity] pair
  PlutusEncodeStream &operator<<(PlutusEncodeStream &s,
                                 const NativeAsset &asset);

  /// Encodes task as Constr 0 [content, expiration, lovelace, assets]
  PlutusEncodeStream &operator<<(PlutusEncodeStream &s, const TaskData &task);

  /// Pre-hash bytes of task
  outcome::result<Bytes> encodeTask(const TaskData &task);

  /**
   * Computes task hash, matching on-chain
   * blake2b_256(serialiseData(task))
   * @return 64 character lowercase hex hash
   */
  outcome::result<std::string> computeTaskHash(const TaskData &task);

  /// Checks task against expected hash, case-insensitive
  bool verifyTaskHash(const TaskData &task, std::string_view expected_hash);

  bool isValidTaskHash(std::string_view hash);

  /// Hex of pre-hash bytes, for comparison with on-chain datum
  outcome::result<std::string> debugTaskCbor(const TaskData &task);
}  // namespace andamio::hashing
