/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace andamio::codec::json {
  enum class JsonError {
    kParse = 1,
    kWrongType,
  };
}  // namespace andamio::codec::json

OUTCOME_HPP_DECLARE_ERROR(andamio::codec::json, JsonError);
