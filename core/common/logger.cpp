/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace andamio::common {
  namespace {
    constexpr auto kPattern{"[%Y-%m-%d %H:%M:%S][th:%t][%l][%n] %v"};
  }  // namespace

  Logger createLogger(const std::string &tag) {
    auto logger = spdlog::get(tag);
    if (logger == nullptr) {
      try {
        // logs go to stderr, stdout is reserved for command output
        logger = spdlog::stderr_color_mt(tag);
      } catch (const spdlog::spdlog_ex &) {
        // registered concurrently by another thread
        return spdlog::get(tag);
      }
      logger->set_pattern(kPattern);
      logger->set_level(spdlog::get_level());
    }
    return logger;
  }

  bool setLogLevel(std::string_view level) {
    const auto parsed{spdlog::level::from_str(std::string{level})};
    // from_str falls back to "off" for unknown names
    if (parsed == spdlog::level::off && level != "off") {
      return false;
    }
    spdlog::set_level(parsed);
    return true;
  }
}  // namespace andamio::common
