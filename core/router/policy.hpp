/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "router/types.hpp"

namespace fr::router {
  /**
   * Distribution configuration of one vault. Created once, never mutated.
   */
  struct Policy {
    VaultId vault;
    /// receives everything not paid to investors
    AccountId creator_wallet;
    /// upper bound of the investor fraction of claimed fees
    BasisPoints investor_fee_share_bps{};
    /// total investor payout per day, none means unbounded
    boost::optional<TokenAmount> daily_cap;
    /// payouts below are dust and stay with the creator remainder
    TokenAmount min_payout{};
    /// Y0, original allocation across all investors
    TokenAmount y0_total_allocation{};
    uint32_t total_investors{};
  };

  inline bool operator==(const Policy &lhs, const Policy &rhs) {
    return lhs.vault == rhs.vault && lhs.creator_wallet == rhs.creator_wallet
           && lhs.investor_fee_share_bps == rhs.investor_fee_share_bps
           && lhs.daily_cap == rhs.daily_cap && lhs.min_payout == rhs.min_payout
           && lhs.y0_total_allocation == rhs.y0_total_allocation
           && lhs.total_investors == rhs.total_investors;
  }

  /**
   * Checks policy parameters
   * @return kInvalidFeeShare, kZeroTotalAllocation or kInvalidInvestorCount
   */
  outcome::result<void> validatePolicy(const Policy &policy);
}  // namespace fr::router
