/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gsl/span>
#include <string_view>

namespace andamio::common::span {
  template <typename To, typename From>
  constexpr auto cast(From *ptr) {
    // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
    return reinterpret_cast<To *>(ptr);
  }

  template <typename To, typename From>
  constexpr auto cast(gsl::span<From> span) {
    static_assert(sizeof(To) == 1);
    return gsl::make_span(cast<To>(span.data()), span.size_bytes());
  }

  inline auto cbytes(std::string_view str) {
    return gsl::make_span(cast<const uint8_t>(str.data()), str.size());
  }

  constexpr auto cstring(gsl::span<const uint8_t> span) {
    return cast<const char>(span);
  }

  constexpr auto bytestr(gsl::span<const uint8_t> span) {
    return std::string_view(cstring(span).data(), span.size());
  }
}  // namespace andamio::common::span
