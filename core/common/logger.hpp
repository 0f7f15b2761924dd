/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/ostr.h>
#include <spdlog/spdlog.h>

namespace andamio::common {
  using Logger = std::shared_ptr<spdlog::logger>;

  /**
   * Provide logger object
   * @param tag - tagging name for identifying logger
   * @return logger object
   */
  Logger createLogger(const std::string &tag);

  /**
   * Set level of every logger created so far and of the ones created later
   * @param level - spdlog level name: trace, debug, info,
   * warn, error, critical, off
   * @return false if level name is unknown
   */
  bool setLogLevel(std::string_view level);
}  // namespace andamio::common
