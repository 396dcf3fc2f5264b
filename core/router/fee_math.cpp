/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/fee_math.hpp"

#include <limits>

#include "router/constants.hpp"
#include "router/router_error.hpp"

namespace fr::router::math {
  outcome::result<TokenAmount> toAmount(const uint128_t &value) {
    if (value > std::numeric_limits<TokenAmount>::max()) {
      return RouterError::kMathOverflow;
    }
    return value.convert_to<TokenAmount>();
  }

  outcome::result<TokenAmount> checkedAdd(TokenAmount lhs, TokenAmount rhs) {
    if (lhs > std::numeric_limits<TokenAmount>::max() - rhs) {
      return RouterError::kMathOverflow;
    }
    return lhs + rhs;
  }

  outcome::result<TokenAmount> checkedSub(TokenAmount lhs, TokenAmount rhs) {
    if (lhs < rhs) {
      return RouterError::kMathOverflow;
    }
    return lhs - rhs;
  }

  outcome::result<TokenAmount> mulDiv(TokenAmount value,
                                      uint64_t numerator,
                                      uint64_t denominator) {
    if (denominator == 0) {
      return RouterError::kMathOverflow;
    }
    const uint128_t result{uint128_t{value} * numerator / denominator};
    return toAmount(result);
  }

  BasisPoints eligibleShareBps(TokenAmount total_locked,
                               TokenAmount y0,
                               BasisPoints max_bps) {
    if (y0 == 0) {
      return 0;
    }
    // f_locked scaled to basis points, saturates at 100%
    uint128_t locked_bps{uint128_t{total_locked} * kBasisPointsDivisor / y0};
    if (locked_bps > kBasisPointsDivisor) {
      locked_bps = kBasisPointsDivisor;
    }
    return std::min(max_bps, locked_bps.convert_to<BasisPoints>());
  }

  outcome::result<TokenAmount> investorPool(
      TokenAmount claimed,
      BasisPoints eligible_bps,
      const boost::optional<TokenAmount> &daily_cap) {
    OUTCOME_TRY(pool, mulDiv(claimed, eligible_bps, kBasisPointsDivisor));
    if (daily_cap) {
      pool = std::min(pool, *daily_cap);
    }
    return pool;
  }

  outcome::result<TokenAmount> investorPayout(TokenAmount pool,
                                              TokenAmount locked,
                                              TokenAmount total_locked) {
    if (total_locked == 0) {
      return TokenAmount{0};
    }
    return mulDiv(pool, locked, total_locked);
  }
}  // namespace fr::router::math
