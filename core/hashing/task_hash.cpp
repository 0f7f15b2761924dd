/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "hashing/task_hash.hpp"

#include "codec/plutus/plutus.hpp"
#include "common/logger.hpp"
#include "hashing/hash_format.hpp"

namespace andamio::hashing {
  namespace {
    common::Logger log() {
      static common::Logger logger{common::createLogger("task_hash")};
      return logger;
    }
  }  // namespace

  PlutusEncodeStream &operator<<(PlutusEncodeStream &s,
                                 const NativeAsset &asset) {
    auto pair{PlutusEncodeStream::tuple()};
    pair << asset.asset_class << asset.quantity;
    return s << pair;
  }

  PlutusEncodeStream &operator<<(PlutusEncodeStream &s, const TaskData &task) {
    auto fields{PlutusEncodeStream::constr(0)};
    fields << task.content << task.expiration << task.lovelace
           << task.native_assets;
    return s << fields;
  }

  outcome::result<Bytes> encodeTask(const TaskData &task) {
    return codec::plutus::encode(task);
  }

  outcome::result<std::string> computeTaskHash(const TaskData &task) {
    OUTCOME_TRY(encoded, encodeTask(task));
    if (log()->should_log(spdlog::level::trace)) {
      log()->trace("task: {}", common::hex_lower(encoded));
    }
    return hashToHex(crypto::blake2b::blake2b_256(encoded));
  }

  bool verifyTaskHash(const TaskData &task, std::string_view expected_hash) {
    auto computed{computeTaskHash(task)};
    if (!computed) {
      log()->warn("task hash failed: {}", computed.error().message());
      return false;
    }
    if (!hashEquals(computed.value(), expected_hash)) {
      log()->warn(
          "task hash mismatch: {} != {}", computed.value(), expected_hash);
      return false;
    }
    return true;
  }

  bool isValidTaskHash(std::string_view hash) {
    return isValidHashFormat(hash);
  }

  outcome::result<std::string> debugTaskCbor(const TaskData &task) {
    OUTCOME_TRY(encoded, encodeTask(task));
    return common::hex_lower(encoded);
  }
}  // namespace andamio::hashing
