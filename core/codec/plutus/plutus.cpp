/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/plutus/plutus.hpp"

namespace andamio::codec::plutus {
  namespace {
    Bytes concat(gsl::span<const Bytes> items) {
      Bytes result;
      for (const auto &item : items) {
        append(result, item);
      }
      return result;
    }
  }  // namespace

  outcome::result<Bytes> encodeByteString(BytesIn bytes) {
    if (bytes.size() > kMaxByteStringSize) {
      return PlutusEncodeError::kByteStringTooLarge;
    }
    Bytes result;
    writeByteString(result, bytes);
    return result;
  }

  Bytes encodeChunkedByteString(BytesIn bytes) {
    Bytes result;
    writeChunkedByteString(result, bytes);
    return result;
  }

  Bytes encodeInteger(const BigInt &num) {
    PlutusEncodeStream s;
    s << num;
    return s.data();
  }

  Bytes encodeList(gsl::span<const Bytes> items) {
    Bytes result;
    writeListItems(result, items.size(), concat(items));
    return result;
  }

  Bytes encodeConstr(gsl::span<const Bytes> fields) {
    return encodeConstr(0, fields);
  }

  Bytes encodeConstr(uint64_t index, gsl::span<const Bytes> fields) {
    Bytes result;
    writeConstr(result, index, fields.size(), concat(fields));
    return result;
  }
}  // namespace andamio::codec::plutus
