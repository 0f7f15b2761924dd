/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "hashing/canonical.hpp"
#include "hashing/commitment_hash.hpp"
#include "hashing/slt_hash.hpp"
#include "hashing/task_hash.hpp"
