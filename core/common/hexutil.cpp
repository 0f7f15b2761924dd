/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/hexutil.hpp"

#include <algorithm>
#include <boost/algorithm/hex.hpp>
#include <cctype>

OUTCOME_CPP_DEFINE_CATEGORY(andamio::common, UnhexError, e) {
  using andamio::common::UnhexError;
  switch (e) {
    case UnhexError::kNonHexInput:
      return "Input contains non-hex characters";
    case UnhexError::kNotEnoughInput:
      return "Input contains odd number of characters";
  }
  return "Unknown error";
}

namespace andamio::common {
  std::string hex_upper(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex(bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  std::string hex_lower(BytesIn bytes) {
    std::string res;
    res.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(res));
    return res;
  }

  outcome::result<Bytes> unhex(std::string_view hex) {
    Bytes blob;
    blob.reserve((hex.size() + 1) / 2);
    try {
      boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(blob));
      return blob;
    } catch (const boost::algorithm::not_enough_input &) {
      return UnhexError::kNotEnoughInput;
    } catch (const boost::algorithm::non_hex_input &) {
      return UnhexError::kNonHexInput;
    }
  }

  bool isHex(std::string_view str) {
    return std::all_of(str.begin(), str.end(), [](char c) {
      return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
  }

  std::string toLowerAscii(std::string_view str) {
    std::string res{str};
    std::transform(res.begin(), res.end(), res.begin(), [](char c) {
      return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    });
    return res;
  }
}  // namespace andamio::common
