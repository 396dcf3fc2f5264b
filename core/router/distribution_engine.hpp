/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "router/policy.hpp"
#include "router/progress.hpp"

namespace fr::router {
  /**
   * Investor split of one day, fixed on its first page
   */
  struct DaySplit {
    TokenAmount total_locked{};
    BasisPoints eligible_bps{};
    TokenAmount investor_pool{};
  };

  struct Payout {
    InvestorIndex index{};
    TokenAmount amount{};
  };

  /**
   * Input of one crank page
   */
  struct PageInput {
    InvestorIndex page_start{};
    uint32_t page_size{};
    UnixTime now{};
    /**
     * Locked amount per investor, of the whole investor set on the first page
     * of a day, of the page slice otherwise
     */
    std::vector<TokenAmount> locked;
    /// fees claimed in the designated asset, used on the first page only
    TokenAmount claimed{};
  };

  /**
   * Effects of one page. Nothing is applied, the caller moves the funds and
   * stores next.
   */
  struct PageResult {
    DistributionProgress next;
    /// set on the first page of a day
    boost::optional<DaySplit> day_split;
    /// transfers to investors, in index order
    std::vector<Payout> payouts;
    /// investors whose payout was below the minimum
    std::vector<InvestorIndex> dust;
    TokenAmount paid{};
    TokenAmount dust_amount{};
    /// creator remainder, set when the page closes the day
    boost::optional<TokenAmount> creator_payout;
  };

  /// Number of investors covered by a page, the last page may be short
  uint32_t pageLength(const Policy &policy,
                      InvestorIndex page_start,
                      uint32_t page_size);

  /**
   * Admission of a page, checked before anything is claimed or paid.
   * The page must start at the cursor, a new day only after the
   * distribution window elapsed. The first page of a day carries all
   * investors, later pages exactly their slice.
   * @param accounts number of investor accounts supplied with the page
   */
  outcome::result<void> admitPage(const Policy &policy,
                                  const DistributionProgress &progress,
                                  InvestorIndex page_start,
                                  uint32_t page_size,
                                  size_t accounts,
                                  UnixTime now);

  /**
   * Split of claimed fees between investors and creator
   * @param locked locked amounts of all investors
   */
  outcome::result<DaySplit> computeDaySplit(
      const Policy &policy,
      TokenAmount claimed,
      const std::vector<TokenAmount> &locked);

  /// Progress at the beginning of a day, before its first page is paid
  DistributionProgress startDay(const DistributionProgress &progress,
                                UnixTime now,
                                TokenAmount claimed,
                                const DaySplit &split);

  /**
   * Pays one page of a started day and closes the day once the cursor
   * reaches the end of the investor set
   * @param page_locked locked amounts of the page slice
   */
  outcome::result<PageResult> distributePage(
      const Policy &policy,
      const DistributionProgress &progress,
      InvestorIndex page_start,
      const std::vector<TokenAmount> &page_locked,
      UnixTime now);

  /**
   * Full transition of one crank page
   */
  outcome::result<PageResult> runPage(const Policy &policy,
                                      const DistributionProgress &progress,
                                      const PageInput &input);
}  // namespace fr::router
