/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/policy.hpp"

#include "router/constants.hpp"
#include "router/router_error.hpp"

namespace fr::router {
  outcome::result<void> validatePolicy(const Policy &policy) {
    if (policy.investor_fee_share_bps > kBasisPointsDivisor) {
      return RouterError::kInvalidFeeShare;
    }
    if (policy.y0_total_allocation == 0) {
      return RouterError::kZeroTotalAllocation;
    }
    if (policy.total_investors == 0
        || policy.total_investors > kMaxInvestors) {
      return RouterError::kInvalidInvestorCount;
    }
    return outcome::success();
  }
}  // namespace fr::router
