/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>

namespace andamio::primitives {
  using BigInt = boost::multiprecision::cpp_int;
}  // namespace andamio::primitives
