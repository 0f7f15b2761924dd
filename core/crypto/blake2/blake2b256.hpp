/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"

namespace andamio::crypto::blake2b {
  constexpr size_t kBlake2b256HashLength = 32;  // 256 BIT

  using Blake2b256Hash = common::Blob<kBlake2b256HashLength>;

  /**
   * Incremental unkeyed blake2b-256 (RFC 7693)
   */
  class Blake2bCtx {
   public:
    Blake2bCtx();
    void update(BytesIn in);
    Blake2b256Hash final();

   private:
    void compress(bool last);

    std::array<uint8_t, 128> b_{};
    std::array<uint64_t, 8> h_{};
    std::array<uint64_t, 2> t_{};
    size_t c_{};
  };

  /**
   * @brief Get blake2b-256 hash
   * @param to_hash - data to hash
   * @return hash
   */
  Blake2b256Hash blake2b_256(BytesIn to_hash);
}  // namespace andamio::crypto::blake2b
