/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace andamio::codec::plutus {
  enum class PlutusEncodeError {
    kByteStringTooLarge = 1,
  };
}  // namespace andamio::codec::plutus

OUTCOME_HPP_DECLARE_ERROR(andamio::codec::plutus, PlutusEncodeError);
