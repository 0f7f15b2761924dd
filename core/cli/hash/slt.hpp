/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "cli/hash/check.hpp"
#include "cli/hash/hash.hpp"
#include "codec/json/json.hpp"
#include "hashing/slt_hash.hpp"

namespace andamio::cli::_hash {
  struct Hash_slt {
    struct Args {
      CLI_OPTIONAL("file,f",
                   "read learning targets from JSON array of strings",
                   std::string)
      file;
      CLI_OPTIONAL("expect", "hash to verify against", std::string) expect;
      CLI_BOOL("cbor", "print pre-hash bytes instead of hash") cbor;

      CLI_OPTS() {
        Opts opts;
        file(opts);
        expect(opts);
        cbor(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Hash::Setup setup{argm};
      cliPositional(argv);
      std::vector<std::string> slts;
      if (args.file) {
        if (!argv.empty()) {
          throw CliError{"--file and positional targets are exclusive"};
        }
        const auto text{cliTry(readInput(*args.file),
                               "reading \"{}\"",
                               *args.file)};
        const auto json{cliTry(codec::json::parse(text), "parsing targets")};
        slts = cliTry(codec::json::jStrings(&json),
                      "expected JSON array of strings");
      } else {
        slts = std::move(argv);
      }
      if (args.cbor) {
        fmt::print("{}\n",
                   common::hex_lower(
                       cliTry(hashing::encodeSlts(slts), "encoding targets")));
        return;
      }
      const auto hash{
          cliTry(hashing::computeSltHash(slts), "hashing targets")};
      printHash(hash, args.expect.v);
    }
    constexpr static std::string_view kDescription{
        "module token name of learning targets"};
  };
}  // namespace andamio::cli::_hash
