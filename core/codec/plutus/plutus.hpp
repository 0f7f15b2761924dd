/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <system_error>

#include "codec/plutus/plutus_encode_stream.hpp"
#include "codec/plutus/plutus_errors.hpp"

namespace andamio::codec::plutus {
  /**
   * @brief Plutus Data encoding to byte-vector
   * @tparam T type to be encoded, must have PlutusEncodeStream operator<<
   * @param arg data to be encoded
   * @return encoded data
   */
  template <typename T>
  outcome::result<Bytes> encode(const T &arg) {
    try {
      PlutusEncodeStream encoder;
      encoder << arg;
      return encoder.data();
    } catch (std::system_error &e) {
      return outcome::failure(e.code());
    }
  }

  /**
   * @brief Definite length byte string: 0x40+len, 0x58 len or 0x59 len16
   * @param bytes payload of at most 65535 bytes
   * @return encoded bytes or kByteStringTooLarge
   */
  outcome::result<Bytes> encodeByteString(BytesIn bytes);

  /**
   * @brief Byte string chunked at 64 bytes the way the chain converts strings
   * to builtin byte strings. Payload of at most 64 bytes is encoded as
   * definite byte string, longer one as indefinite byte string of chunks.
   */
  Bytes encodeChunkedByteString(BytesIn bytes);

  /// Integer with shortest head, major type 0 or 1
  template <typename T,
            typename = std::enable_if_t<std::is_integral_v<T>
                                        && !std::is_same_v<T, bool>>>
  Bytes encodeInteger(T num) {
    PlutusEncodeStream s;
    s << num;
    return s.data();
  }

  /// Integer of any size, bignum tag 2 or 3 outside of 64-bit range
  Bytes encodeInteger(const BigInt &num);

  /// List of encoded items: 0x9f items 0xff, or 0x80 if empty
  Bytes encodeList(gsl::span<const Bytes> items);

  /// Constructor of alternative 0 with encoded fields: 0xd879 + list
  Bytes encodeConstr(gsl::span<const Bytes> fields);

  /// Constructor of any alternative with encoded fields
  Bytes encodeConstr(uint64_t index, gsl::span<const Bytes> fields);
}  // namespace andamio::codec::plutus
