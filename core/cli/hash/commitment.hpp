/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/hash/check.hpp"
#include "cli/hash/hash.hpp"
#include "hashing/canonical.hpp"
#include "hashing/commitment_hash.hpp"

namespace andamio::cli::_hash {
  struct Hash_commitment {
    struct Args {
      CLI_OPTIONAL("expect", "on-chain hash to verify against", std::string)
      expect;
      CLI_BOOL("canonical", "print normalized evidence instead of hash")
      canonical;

      CLI_OPTS() {
        Opts opts;
        expect(opts);
        canonical(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Hash::Setup setup{argm};
      const auto path{cliArgv(argv, "evidence file, - for stdin")};
      const auto text{cliTry(readInput(path), "reading \"{}\"", path)};
      const auto evidence{
          cliTry(codec::json::parse(text), "parsing evidence \"{}\"", path)};
      if (args.canonical) {
        const auto normalized{hashing::normalizeForHashing(&evidence)};
        fmt::print("{}\n", codec::json::format(&normalized));
        return;
      }
      if (!args.expect) {
        fmt::print("{}\n", hashing::computeCommitmentHash(&evidence));
        return;
      }
      const auto result{
          hashing::verifyEvidenceDetailed(&evidence, *args.expect)};
      if (!result.computed_hash.empty()) {
        fmt::print("{}\n", result.computed_hash);
      }
      if (!result.valid) {
        throw CliError{"{}", result.message};
      }
      fmt::print("{}\n", result.message);
    }
    constexpr static std::string_view kDescription{
        "commitment hash of evidence JSON document"};
  };
}  // namespace andamio::cli::_hash
