/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "cli/hash/commitment.hpp"
#include "cli/hash/policy.hpp"
#include "cli/hash/slt.hpp"
#include "cli/hash/task.hpp"
#include "cli/run.hpp"

#define CMD(NAME, TYPE) \
  { NAME, tree<TYPE>() }

namespace andamio::cli::_hash {
  inline const Tree &hashTree() {
    static const auto _tree{tree<Hash>({
        CMD("slt", Hash_slt),
        CMD("task", Hash_task),
        CMD("commitment", Hash_commitment),
        CMD("policy-id", Hash_policyId),
        CMD("asset-name", Hash_assetName),
    })};
    return _tree;
  }
}  // namespace andamio::cli::_hash

#undef CMD
