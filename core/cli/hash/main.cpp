/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cli/hash/commands.hpp"

int main(int argc, const char *argv[]) {
  return andamio::cli::run(
      "andamio_hash", andamio::cli::_hash::hashTree(), argc, argv);
}
