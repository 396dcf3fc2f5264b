/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/progress.hpp"

namespace fr::router {
  bool operator==(const DistributionProgress &lhs,
                  const DistributionProgress &rhs) {
    return lhs.vault == rhs.vault
           && lhs.last_distribution_ts == rhs.last_distribution_ts
           && lhs.cursor == rhs.cursor && lhs.paid == rhs.paid
           && lhs.current_day_total_claimed == rhs.current_day_total_claimed
           && lhs.current_day_distributed == rhs.current_day_distributed
           && lhs.day_completed == rhs.day_completed
           && lhs.current_day_start_ts == rhs.current_day_start_ts
           && lhs.current_day_total_locked == rhs.current_day_total_locked
           && lhs.current_day_eligible_bps == rhs.current_day_eligible_bps
           && lhs.current_day_investor_pool == rhs.current_day_investor_pool
           && lhs.total_distributions == rhs.total_distributions
           && lhs.total_investor_distributed == rhs.total_investor_distributed
           && lhs.total_creator_distributed == rhs.total_creator_distributed;
  }

  DistributionProgress initialProgress(const VaultId &vault) {
    DistributionProgress progress;
    progress.vault = vault;
    progress.last_distribution_ts = kNeverDistributed;
    progress.day_completed = true;
    return progress;
  }
}  // namespace fr::router
