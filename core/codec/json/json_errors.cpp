/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/json/json_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(andamio::codec::json, JsonError, e) {
  using E = andamio::codec::json::JsonError;
  switch (e) {
    case E::kParse:
      return "invalid json";
    case E::kWrongType:
      return "wrong type";
  }

  return "unknown JsonError error code";
}
