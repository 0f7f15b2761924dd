/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <fmt/format.h>

#include "cli/hash/hash.hpp"
#include "constants/policies.hpp"

namespace andamio::cli::_hash {
  struct Hash_policyId : Empty {
    CLI_RUN() {
      const Hash::Setup setup{argm};
      const auto policy_id{cliArgv(argv, "policy-id")};
      if (!constants::isValidPolicyId(policy_id)) {
        throw CliError{"invalid policy id \"{}\", expected {} hex characters",
                       policy_id,
                       constants::kPolicyIdHexLength};
      }
      fmt::print("valid\n");
    }
    constexpr static std::string_view kDescription{"validate policy id"};
  };

  struct Hash_assetName {
    struct Args {
      CLI_BOOL("encode", "convert text to asset name hex") encode;
      CLI_BOOL("decode", "convert asset name hex to text") decode;

      CLI_OPTS() {
        Opts opts;
        encode(opts);
        decode(opts);
        return opts;
      }
    };
    CLI_RUN() {
      const Hash::Setup setup{argm};
      const auto name{cliArgv(argv, "asset-name")};
      if (args.encode) {
        fmt::print("{}\n", constants::stringToAssetName(name));
        return;
      }
      if (!constants::isValidAssetName(name)) {
        throw CliError{
            "invalid asset name \"{}\", expected even length hex of at most {} "
            "characters",
            name,
            constants::kAssetNameMaxHexLength};
      }
      if (args.decode) {
        fmt::print("{}\n",
                   cliTry(constants::assetNameToString(name),
                          "decoding asset name"));
        return;
      }
      fmt::print("valid\n");
    }
    constexpr static std::string_view kDescription{
        "validate, encode or decode asset name"};
  };
}  // namespace andamio::cli::_hash
