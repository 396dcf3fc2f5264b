/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <spdlog/fmt/fmt.h>
#include <system_error>

/**
 * std::error_code error;
 * fmt::format("{}", error);   // "CATEGORY:VALUE"
 * fmt::format("{:#}", error); // "MESSAGE (CATEGORY:VALUE)"
 */
template <>
struct fmt::formatter<std::error_code, char, void> {
  bool with_message{false};

  template <typename ParseContext>
  constexpr auto parse(ParseContext &ctx) {
    auto it{ctx.begin()};
    if (it != ctx.end() && *it == '#') {
      with_message = true;
      ++it;
    }
    return it;
  }

  template <typename FormatContext>
  auto format(const std::error_code &ec, FormatContext &ctx) const {
    if (!with_message) {
      return fmt::format_to(
          ctx.out(), "{}:{}", ec.category().name(), ec.value());
    }
    return fmt::format_to(ctx.out(),
                          "{} ({}:{})",
                          ec.message(),
                          ec.category().name(),
                          ec.value());
  }
};
