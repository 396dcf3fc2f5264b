/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/multiprecision/cpp_int.hpp>
#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "router/types.hpp"

namespace fr::router::math {
  using boost::multiprecision::uint128_t;

  /// Narrows a 128-bit intermediate, kMathOverflow if it does not fit
  outcome::result<TokenAmount> toAmount(const uint128_t &value);

  outcome::result<TokenAmount> checkedAdd(TokenAmount lhs, TokenAmount rhs);

  outcome::result<TokenAmount> checkedSub(TokenAmount lhs, TokenAmount rhs);

  /**
   * floor(value * numerator / denominator) computed in 128 bits
   * @return kMathOverflow on zero denominator or unrepresentable result
   */
  outcome::result<TokenAmount> mulDiv(TokenAmount value,
                                      uint64_t numerator,
                                      uint64_t denominator);

  /**
   * Investor share of claimed fees:
   * min(max_bps, floor(min(1, total_locked / y0) * 10000))
   * @param y0 total allocation, must be positive
   */
  BasisPoints eligibleShareBps(TokenAmount total_locked,
                               TokenAmount y0,
                               BasisPoints max_bps);

  /**
   * floor(claimed * eligible_bps / 10000), bounded by daily_cap when set
   */
  outcome::result<TokenAmount> investorPool(
      TokenAmount claimed,
      BasisPoints eligible_bps,
      const boost::optional<TokenAmount> &daily_cap);

  /**
   * floor(pool * locked / total_locked), zero when nothing is locked
   */
  outcome::result<TokenAmount> investorPayout(TokenAmount pool,
                                              TokenAmount locked,
                                              TokenAmount total_locked);
}  // namespace fr::router::math
