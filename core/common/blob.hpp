/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>

#include "common/hexutil.hpp"

namespace andamio::common {
  enum class BlobError { kIncorrectLength = 1 };

  /**
   * Fixed-size byte array, e.g. a hash digest
   * @tparam size_ - number of bytes
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    /// Number of bytes in this blob
    static constexpr size_t size() {
      return size_;
    }

    /// Initialize blob value with zeros
    constexpr Blob() : std::array<uint8_t, size_>{} {}

    /// Initialize blob value from array
    explicit Blob(const std::array<uint8_t, size_> &l)
        : std::array<uint8_t, size_>{l} {}

    /// Converts blob to lowercase hex string
    std::string toHex() const {
      return hex_lower(*this);
    }

    /// Creates blob from span of bytes
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (span.size() != size_) {
        return BlobError::kIncorrectLength;
      }
      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }

    /// Creates blob from hex string of any case
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(bytes, unhex(hex));
      return fromSpan(bytes);
    }
  };

  using Hash256 = Blob<32>;
}  // namespace andamio::common

OUTCOME_HPP_DECLARE_ERROR(andamio::common, BlobError);
