/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>
#include <boost/optional.hpp>
#include <iostream>

#include "cli/try.hpp"
#include "common/file.hpp"
#include "hashing/hash_format.hpp"

namespace andamio::cli::_hash {
  /// Reads file, or stdin if path is "-"
  inline outcome::result<std::string> readInput(const std::string &path) {
    if (path == "-") {
      return common::readStream(std::cin);
    }
    return common::readFile(path);
  }

  /**
   * Prints computed hash, then compares it with expected one if given.
   * Mismatch is reported as error.
   */
  inline void printHash(const std::string &hash,
                        const boost::optional<std::string> &expect) {
    fmt::print("{}\n", hash);
    if (!expect) {
      return;
    }
    if (!hashing::isValidHashFormat(*expect)) {
      throw CliError{"invalid hash format \"{}\", expected {} hex characters",
                     *expect,
                     hashing::kHashHexLength};
    }
    if (!hashing::hashEquals(hash, *expect)) {
      throw CliError{"hash mismatch, expected {}", *expect};
    }
    fmt::print("match\n");
  }
}  // namespace andamio::cli::_hash
