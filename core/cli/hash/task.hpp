/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/hash/check.hpp"
#include "cli/hash/hash.hpp"
#include "cli/validate/native_asset.hpp"
#include "hashing/task_hash.hpp"

namespace andamio::cli::_hash {
  using hashing::NativeAsset;
  using hashing::TaskData;

  struct Hash_task {
    struct Args {
      CLI_OPTIONAL("content", "task description", std::string) content;
      CLI_OPTIONAL("expiration", "expiration, POSIX milliseconds", int64_t)
      expiration;
      CLI_OPTIONAL("lovelace", "reward in lovelace", int64_t) lovelace;
      std::vector<NativeAsset> assets;
      CLI_OPTIONAL("expect", "hash to verify against", std::string) expect;
      CLI_BOOL("cbor", "print pre-hash bytes instead of hash") cbor;

      CLI_OPTS() {
        Opts opts;
        content(opts);
        expiration(opts);
        lovelace(opts);
        opts.add_options()("asset",
                           po::value(&assets)->composing(),
                           "native asset reward POLICY.NAME=QTY, repeatable");
        expect(opts);
        cbor(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Hash::Setup setup{argm};
      cliNoArgv(argv);
      const TaskData task{
          *args.content, *args.expiration, *args.lovelace, args.assets};
      if (args.cbor) {
        fmt::print("{}\n",
                   cliTry(hashing::debugTaskCbor(task), "encoding task"));
        return;
      }
      const auto hash{cliTry(hashing::computeTaskHash(task), "hashing task")};
      printHash(hash, args.expect.v);
    }
    constexpr static std::string_view kDescription{"hash of project task"};
  };
}  // namespace andamio::cli::_hash
