/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/plutus/plutus_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(andamio::codec::plutus, PlutusEncodeError, e) {
  using andamio::codec::plutus::PlutusEncodeError;
  switch (e) {
    case PlutusEncodeError::kByteStringTooLarge:
      return "Byte string too long for CBOR encoding, at most 65535 bytes";
  }
  return "Unknown error";
}
