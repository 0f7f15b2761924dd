/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/plutus/plutus_encode_stream.hpp"

#include <algorithm>
#include <limits>

#include "codec/plutus/plutus_errors.hpp"
#include "common/span.hpp"

namespace andamio::codec::plutus {
  using cbor::CborToken;

  /// Tags of constructor alternatives 0-6 and 7-127
  constexpr uint64_t kConstrTagSmall{121};
  constexpr uint64_t kConstrTagLarge{1280};
  /// Tag of constructor with explicit alternative
  constexpr uint64_t kConstrTagGeneral{102};

  PlutusEncodeStream &PlutusEncodeStream::operator<<(const BigInt &num) {
    static const BigInt kMaxUint64{std::numeric_limits<uint64_t>::max()};
    if (num >= 0 && num <= kMaxUint64) {
      return *this << num.convert_to<uint64_t>();
    }
    const BigInt magnitude{num < 0 ? BigInt{-1 - num} : num};
    addCount(1);
    if (num < 0 && magnitude <= kMaxUint64) {
      cbor::writeNegative(data_, magnitude.convert_to<uint64_t>());
      return *this;
    }
    Bytes be;
    export_bits(magnitude, std::back_inserter(be), 8);
    cbor::writeTag(
        data_,
        num < 0 ? cbor::kTagNegativeBignum : cbor::kTagPositiveBignum);
    writeChunkedByteString(data_, be);
    return *this;
  }

  PlutusEncodeStream &PlutusEncodeStream::operator<<(BytesIn bytes) {
    addCount(1);
    writeChunkedByteString(data_, bytes);
    return *this;
  }

  PlutusEncodeStream &PlutusEncodeStream::operator<<(const Bytes &bytes) {
    return *this << BytesIn{bytes};
  }

  PlutusEncodeStream &PlutusEncodeStream::operator<<(std::string_view str) {
    return *this << common::span::cbytes(str);
  }

  PlutusEncodeStream &PlutusEncodeStream::operator<<(const std::string &str) {
    return *this << std::string_view{str};
  }

  PlutusEncodeStream &PlutusEncodeStream::operator<<(const char *str) {
    return *this << std::string_view{str};
  }

  PlutusEncodeStream &PlutusEncodeStream::operator<<(
      const PlutusEncodeStream &other) {
    addCount(other.framing_ == Framing::kFlat ? other.count_ : 1);
    append(data_, other.data());
    return *this;
  }

  Bytes PlutusEncodeStream::data() const {
    Bytes result;
    switch (framing_) {
      case Framing::kFlat:
        copy(result, data_);
        break;
      case Framing::kList:
        writeListItems(result, count_, data_);
        break;
      case Framing::kConstr:
        writeConstr(result, index_, count_, data_);
        break;
      case Framing::kTuple:
        cbor::writeList(result, count_);
        append(result, data_);
        break;
    }
    return result;
  }

  size_t PlutusEncodeStream::count() const {
    return count_;
  }

  PlutusEncodeStream PlutusEncodeStream::list() {
    PlutusEncodeStream stream;
    stream.framing_ = Framing::kList;
    return stream;
  }

  PlutusEncodeStream PlutusEncodeStream::constr(uint64_t index) {
    PlutusEncodeStream stream;
    stream.framing_ = Framing::kConstr;
    stream.index_ = index;
    return stream;
  }

  PlutusEncodeStream PlutusEncodeStream::tuple() {
    PlutusEncodeStream stream;
    stream.framing_ = Framing::kTuple;
    return stream;
  }

  void PlutusEncodeStream::addCount(size_t count) {
    count_ += count;
  }

  void writeByteString(Bytes &out, BytesIn bytes) {
    if (bytes.size() > kMaxByteStringSize) {
      outcome::raise(PlutusEncodeError::kByteStringTooLarge);
    }
    cbor::writeBytes(out, bytes.size());
    append(out, bytes);
  }

  void writeChunkedByteString(Bytes &out, BytesIn bytes) {
    if (bytes.size() <= kChunkSize) {
      writeByteString(out, bytes);
      return;
    }
    cbor::writeIndefinite(out, CborToken::BYTES);
    for (size_t offset{0}; offset < bytes.size(); offset += kChunkSize) {
      writeByteString(
          out,
          bytes.subspan(offset, std::min(kChunkSize, bytes.size() - offset)));
    }
    cbor::writeBreak(out);
  }

  void writeListItems(Bytes &out, size_t count, BytesIn items) {
    if (count == 0) {
      cbor::writeList(out, 0);
      return;
    }
    cbor::writeIndefinite(out, CborToken::LIST);
    append(out, items);
    cbor::writeBreak(out);
  }

  void writeConstr(Bytes &out, uint64_t index, size_t count, BytesIn fields) {
    if (index < 7) {
      cbor::writeTag(out, kConstrTagSmall + index);
    } else if (index < 128) {
      cbor::writeTag(out, kConstrTagLarge + index - 7);
    } else {
      cbor::writeTag(out, kConstrTagGeneral);
      cbor::writeList(out, 2);
      cbor::writeUint(out, index);
    }
    writeListItems(out, count, fields);
  }
}  // namespace andamio::codec::plutus
