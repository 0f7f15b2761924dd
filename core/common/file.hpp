/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>
#include <iosfwd>
#include <string>

#include "common/outcome.hpp"

namespace andamio::common {
  enum class FileError {
    kCannotOpen = 1,
    kCannotRead,
  };

  /// Reads whole file as text
  outcome::result<std::string> readFile(const boost::filesystem::path &path);

  /// Reads stream to the end
  outcome::result<std::string> readStream(std::istream &is);
}  // namespace andamio::common

OUTCOME_HPP_DECLARE_ERROR(andamio::common, FileError);
