/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "router/policy.hpp"
#include "router/position.hpp"
#include "router/progress.hpp"

namespace fr::router {
  /**
   * Summary of a committed crank page
   */
  struct PageReport {
    VaultId vault;
    InvestorIndex page_start{};
    /// investors covered by the page
    uint32_t investors{};
    uint32_t investors_paid{};
    TokenAmount paid{};
    TokenAmount dust{};
    /// fees claimed by the first page of a day
    boost::optional<TokenAmount> claimed;
    /// creator remainder paid by the last page of a day
    boost::optional<TokenAmount> creator_payout;
    InvestorIndex cursor{};
    bool day_completed{};
  };

  /**
   * Permissionless fee distribution of vaults. Every call either commits
   * completely or leaves no trace.
   */
  class FeeRouter {
   public:
    virtual ~FeeRouter() = default;

    /**
     * Creates policy and initial progress of a vault
     */
    virtual outcome::result<void> setupPolicy(const Policy &policy) = 0;

    /**
     * Opens the honorary position of a vault in a pool collecting fees in
     * quote_asset only
     */
    virtual outcome::result<HonoraryPosition> initializePosition(
        const VaultId &vault,
        const PoolId &pool,
        const AssetId &quote_asset) = 0;

    /**
     * Processes one page of the current day.
     * @param investors whole investor set when page_start is the first
     * page of a day, page slice otherwise
     */
    virtual outcome::result<PageReport> runPage(
        const VaultId &vault,
        InvestorIndex page_start,
        uint32_t page_size,
        const std::vector<InvestorAccount> &investors) = 0;

    virtual outcome::result<Policy> getPolicy(const VaultId &vault) const = 0;

    virtual outcome::result<DistributionProgress> getProgress(
        const VaultId &vault) const = 0;

    virtual outcome::result<HonoraryPosition> getPosition(
        const VaultId &vault) const = 0;
  };
}  // namespace fr::router
