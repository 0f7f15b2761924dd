/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"

namespace andamio::codec::cbor {
  constexpr uint8_t kExtraUint8{24};
  constexpr uint8_t kExtraUint16{25};
  constexpr uint8_t kExtraUint32{26};
  constexpr uint8_t kExtraUint64{27};
  constexpr uint8_t kExtraIndefinite{31};

  /// Tags of positive and negative bignums, RFC 8949 section 3.4.3
  constexpr uint64_t kTagPositiveBignum{2};
  constexpr uint64_t kTagNegativeBignum{3};

  /// Major type and argument of CBOR data item head
  struct CborToken {
    enum Type : uint8_t {
      UINT,
      INT,
      BYTES,
      STR,
      LIST,
      MAP,
      TAG,
      SPECIAL,
    };

    static constexpr uint8_t _first(Type type, uint8_t first) {
      return (type << 5) | first;
    }
    static constexpr size_t _more(uint64_t extra) {
      if (extra < kExtraUint8) {
        return 0;
      } else if (!(extra & 0xFFFFFFFFFFFFFF00)) {
        return sizeof(uint8_t);
      } else if (!(extra & 0xFFFFFFFFFFFF0000)) {
        return sizeof(uint16_t);
      } else if (!(extra & 0xFFFFFFFF00000000)) {
        return sizeof(uint32_t);
      } else {
        return sizeof(uint64_t);
      }
    }
  };

  /// Terminates indefinite length item
  constexpr BytesN<1> kBreak{
      CborToken::_first(CborToken::SPECIAL, kExtraIndefinite)};

  /**
   * Encodes data item head with shortest argument form.
   * Arguments below 24 are stored in the initial byte, larger ones follow it
   * big-endian in 1, 2, 4 or 8 bytes.
   */
  struct CborTokenEncoder {
    BytesN<9> _bytes{};
    size_t length{};

    constexpr CborTokenEncoder(CborToken::Type type, uint64_t extra) {
      auto more{CborToken::_more(extra)};
      length = 1 + more;
      if (!more) {
        _bytes[0] = CborToken::_first(type, extra);
      } else if (more == sizeof(uint8_t)) {
        _bytes[0] = CborToken::_first(type, kExtraUint8);
        _bytes[1] = extra;
      } else if (more == sizeof(uint16_t)) {
        _bytes[0] = CborToken::_first(type, kExtraUint16);
        _bytes[1] = extra >> 8;
        _bytes[2] = extra;
      } else if (more == sizeof(uint32_t)) {
        _bytes[0] = CborToken::_first(type, kExtraUint32);
        _bytes[1] = extra >> 24;
        _bytes[2] = extra >> 16;
        _bytes[3] = extra >> 8;
        _bytes[4] = extra;
      } else {
        _bytes[0] = CborToken::_first(type, kExtraUint64);
        _bytes[1] = extra >> 56;
        _bytes[2] = extra >> 48;
        _bytes[3] = extra >> 40;
        _bytes[4] = extra >> 32;
        _bytes[5] = extra >> 24;
        _bytes[6] = extra >> 16;
        _bytes[7] = extra >> 8;
        _bytes[8] = extra;
      }
    }
    constexpr operator BytesIn() const {
      return BytesIn{_bytes}.first(length);
    }
  };

  inline void writeUint(Bytes &out, uint64_t value) {
    append(out, CborTokenEncoder{CborToken::Type::UINT, value});
  }
  inline void writeInt(Bytes &out, int64_t value) {
    if (value < 0) {
      // ~value == -1 - value without overflow for INT64_MIN
      append(out, CborTokenEncoder{CborToken::Type::INT, (uint64_t)~value});
    } else {
      writeUint(out, value);
    }
  }
  /// Writes head of negative integer, value is -1 - n
  inline void writeNegative(Bytes &out, uint64_t value) {
    append(out, CborTokenEncoder{CborToken::Type::INT, value});
  }
  inline void writeBytes(Bytes &out, size_t size) {
    append(out, CborTokenEncoder{CborToken::Type::BYTES, size});
  }
  inline void writeList(Bytes &out, size_t count) {
    append(out, CborTokenEncoder{CborToken::Type::LIST, count});
  }
  inline void writeTag(Bytes &out, uint64_t tag) {
    append(out, CborTokenEncoder{CborToken::Type::TAG, tag});
  }
  /// Writes head of indefinite length byte string, list or map
  inline void writeIndefinite(Bytes &out, CborToken::Type type) {
    out.push_back(CborToken::_first(type, kExtraIndefinite));
  }
  inline void writeBreak(Bytes &out) {
    append(out, kBreak);
  }
}  // namespace andamio::codec::cbor
