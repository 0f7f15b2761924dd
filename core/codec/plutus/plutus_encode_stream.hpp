/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>
#include <type_traits>

#include "codec/cbor/cbor_token.hpp"
#include "primitives/big_int.hpp"

namespace andamio::codec::plutus {
  using primitives::BigInt;

  /// Byte strings longer than this are split into chunks of this size
  constexpr size_t kChunkSize{64};
  /// Largest byte string length the encoder frames
  constexpr size_t kMaxByteStringSize{0xFFFF};

  /**
   * Encodes values the way on-chain serialiseData encodes Plutus Data.
   * Byte strings and strings are always routed through 64-byte chunking,
   * lists use indefinite length framing except the empty list.
   * Throws std::system_error with PlutusEncodeError, use encode() to get
   * outcome::result.
   */
  class PlutusEncodeStream {
   public:
    /** Encodes integer */
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>
                                          && !std::is_same_v<T, bool>>>
    PlutusEncodeStream &operator<<(T num) {
      addCount(1);
      if constexpr (std::is_unsigned_v<T>) {
        cbor::writeUint(data_, num);
      } else {
        cbor::writeInt(data_, num);
      }
      return *this;
    }

    /// Encodes elements into list
    template <typename T>
    PlutusEncodeStream &operator<<(const std::vector<T> &values) {
      auto l{list()};
      for (const auto &value : values) {
        l << value;
      }
      return *this << l;
    }

    /** Encodes integer of any size, bignum tag above 64 bits */
    PlutusEncodeStream &operator<<(const BigInt &num);
    /** Encodes bytes as chunked byte string */
    PlutusEncodeStream &operator<<(BytesIn bytes);
    /** Encodes bytes as chunked byte string */
    PlutusEncodeStream &operator<<(const Bytes &bytes);
    /** Encodes UTF-8 bytes of string as chunked byte string */
    PlutusEncodeStream &operator<<(std::string_view str);
    /** Same as string_view, BigInt is implicitly constructible from strings */
    PlutusEncodeStream &operator<<(const std::string &str);
    PlutusEncodeStream &operator<<(const char *str);
    /** Encodes list, constructor or tuple substream */
    PlutusEncodeStream &operator<<(const PlutusEncodeStream &other);

    /** Returns bytes of encoded elements */
    Bytes data() const;
    /** Returns the number of elements */
    size_t count() const;

    /** Creates list substream */
    static PlutusEncodeStream list();
    /** Creates constructor substream, fields are appended with << */
    static PlutusEncodeStream constr(uint64_t index);
    /** Creates definite length array substream, e.g. pair of map entry */
    static PlutusEncodeStream tuple();

   private:
    enum class Framing : uint8_t {
      kFlat,
      kList,
      kConstr,
      kTuple,
    };

    void addCount(size_t count);

    Framing framing_{Framing::kFlat};
    uint64_t index_{};
    Bytes data_{};
    size_t count_{0};
  };

  /**
   * Writes definite length byte string, at most 65535 bytes
   * @param out - output
   * @param bytes - payload
   */
  void writeByteString(Bytes &out, BytesIn bytes);

  /**
   * Writes byte string split into 64-byte chunks of indefinite length byte
   * string, or single definite byte string if it fits one chunk
   * @param out - output
   * @param bytes - payload
   */
  void writeChunkedByteString(Bytes &out, BytesIn bytes);

  /**
   * Writes items of indefinite length list, empty list is definite
   * @param out - output
   * @param count - number of items in items
   * @param items - concatenated item encodings
   */
  void writeListItems(Bytes &out, size_t count, BytesIn items);

  /**
   * Writes constructor with alternative index and fields.
   * Alternatives 0-6 use tags 121-127 and 7-127 use tags 1280-1400, followed
   * by fields list. Other alternatives use tag 102 with [index, fields] pair.
   * @param out - output
   * @param index - constructor alternative
   * @param count - number of fields
   * @param fields - concatenated field encodings
   */
  void writeConstr(Bytes &out, uint64_t index, size_t count, BytesIn fields);
}  // namespace andamio::codec::plutus
