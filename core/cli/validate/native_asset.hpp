/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/lexical_cast.hpp>

#include "cli/validate/with.hpp"
#include "hashing/task_hash.hpp"

namespace andamio::hashing {
  /// Parses "CLASS=QTY", asset class may itself contain '='
  CLI_VALIDATE(NativeAsset) {
    return validateWith(out, values, [](const std::string &value) {
      const auto eq{value.rfind('=')};
      if (eq == std::string::npos || eq == 0) {
        throw std::invalid_argument{value};
      }
      return NativeAsset{value.substr(0, eq),
                         boost::lexical_cast<int64_t>(value.substr(eq + 1))};
    });
  }
}  // namespace andamio::hashing
