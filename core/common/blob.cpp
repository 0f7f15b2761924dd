/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/blob.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(andamio::common, BlobError, e) {
  using andamio::common::BlobError;

  switch (e) {
    case BlobError::kIncorrectLength:
      return "Input string has incorrect length, not matching the blob size";
  }

  return "Unknown error";
}

namespace andamio::common {
  template class Blob<32ul>;
}  // namespace andamio::common
