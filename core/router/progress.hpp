/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <limits>

#include "router/paid_bitmap.hpp"

namespace fr::router {
  /// Last distribution time of a vault which never distributed
  constexpr UnixTime kNeverDistributed{std::numeric_limits<int64_t>::min()};

  /**
   * Mutable state of the current distribution day of one vault.
   * cursor > 0 only while a day is in progress.
   */
  struct DistributionProgress {
    VaultId vault;
    /// time the last day was closed
    UnixTime last_distribution_ts{kNeverDistributed};
    /// index of the next unprocessed investor
    InvestorIndex cursor{};
    PaidBitmap paid;
    TokenAmount current_day_total_claimed{};
    TokenAmount current_day_distributed{};
    bool day_completed{true};

    /// time the current day started, locked amounts are read as of it
    UnixTime current_day_start_ts{};
    /// locked amount across all investors at day start
    TokenAmount current_day_total_locked{};
    BasisPoints current_day_eligible_bps{};
    TokenAmount current_day_investor_pool{};

    uint64_t total_distributions{};
    TokenAmount total_investor_distributed{};
    TokenAmount total_creator_distributed{};

    bool dayInProgress() const {
      return !day_completed;
    }
  };

  bool operator==(const DistributionProgress &lhs,
                  const DistributionProgress &rhs);

  /**
   * Progress created together with the policy. The first crank is
   * immediately eligible.
   */
  DistributionProgress initialProgress(const VaultId &vault);
}  // namespace fr::router
