/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/cli.hpp"
#include "common/logger.hpp"

namespace andamio::cli::_hash {
  struct Hash {
    struct Args {
      CLI_DEFAULT("log-level",
                  "log level: trace, debug, info, warn, error, critical, off",
                  std::string,
                  {"warn"})
      log_level;

      CLI_OPTS() {
        Opts opts;
        log_level(opts);
        return opts;
      }
    };
    CLI_RUN() {
      throw ShowHelp{};
    }
    constexpr static std::string_view kDescription{
        "Plutus-compatible hashes of learning targets, tasks and evidence"};

    /// Applies global options, constructed first by every subcommand
    struct Setup {
      explicit Setup(ArgsMap &argm) {
        const auto &args{argm.of<Hash>()};
        if (!common::setLogLevel(*args.log_level)) {
          throw CliError{"unknown log level \"{}\"", *args.log_level};
        }
      }
    };
  };
}  // namespace andamio::cli::_hash
