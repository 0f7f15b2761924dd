/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/file.hpp"

#include <fstream>
#include <iterator>

OUTCOME_CPP_DEFINE_CATEGORY(andamio::common, FileError, e) {
  using andamio::common::FileError;
  switch (e) {
    case FileError::kCannotOpen:
      return "Cannot open file";
    case FileError::kCannotRead:
      return "Cannot read file";
  }
  return "Unknown error";
}

namespace andamio::common {
  outcome::result<std::string> readFile(const boost::filesystem::path &path) {
    std::ifstream file{path.c_str(), std::ios::binary};
    if (!file.is_open()) {
      return FileError::kCannotOpen;
    }
    return readStream(file);
  }

  outcome::result<std::string> readStream(std::istream &is) {
    std::string result{std::istreambuf_iterator<char>{is},
                       std::istreambuf_iterator<char>{}};
    if (is.bad()) {
      return FileError::kCannotRead;
    }
    return result;
  }
}  // namespace andamio::common
