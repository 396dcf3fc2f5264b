/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <libp2p/outcome/outcome.hpp>

/**
 * OUTCOME_EXCEPT raises exception in case of result has error.
 * Supports 2 forms:
 * OUTCOME_EXCEPT(expr);
 * OUTCOME_EXCEPT(var, expr); // var = expr
 */
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_EXCEPT_1(expr) (expr).value()
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_EXCEPT_2(val, expr) \
  auto(val) {                        \
    (expr).value()                   \
  }
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_EXCEPT_OVERLOAD(_1, _2, NAME, ...) NAME
#define OUTCOME_EXCEPT(...)                                                   \
  _OUTCOME_EXCEPT_OVERLOAD(__VA_ARGS__, _OUTCOME_EXCEPT_2, _OUTCOME_EXCEPT_1) \
  (__VA_ARGS__)

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _OUTCOME_TRYA(var, val, ...) \
  OUTCOME_TRY(var, __VA_ARGS__);     \
  val = std::move(var);
#define OUTCOME_TRYA(val, ...) \
  _OUTCOME_TRYA(BOOST_OUTCOME_TRY_UNIQUE_NAME, val, __VA_ARGS__)

namespace fr::outcome {
  using libp2p::outcome::failure;
  using libp2p::outcome::result;
  using libp2p::outcome::success;
}  // namespace fr::outcome
