/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/distribution_engine.hpp"

#include "router/constants.hpp"
#include "router/fee_math.hpp"
#include "router/router_error.hpp"

namespace fr::router {
  uint32_t pageLength(const Policy &policy,
                      InvestorIndex page_start,
                      uint32_t page_size) {
    if (page_start >= policy.total_investors) {
      return 0;
    }
    return std::min(page_size, policy.total_investors - page_start);
  }

  outcome::result<void> admitPage(const Policy &policy,
                                  const DistributionProgress &progress,
                                  InvestorIndex page_start,
                                  uint32_t page_size,
                                  size_t accounts,
                                  UnixTime now) {
    if (page_size == 0 || page_size > kMaxPageSize) {
      return RouterError::kInvalidPagination;
    }
    if (page_start != progress.cursor) {
      return RouterError::kInvalidPaginationSequence;
    }
    if (page_start >= policy.total_investors) {
      return RouterError::kInvalidPagination;
    }
    const auto day_start{progress.cursor == 0};
    if (day_start
        && progress.last_distribution_ts > now - kDistributionWindow) {
      return RouterError::kCrankWindowNotReached;
    }
    const size_t expected{day_start
                              ? policy.total_investors
                              : pageLength(policy, page_start, page_size)};
    if (accounts != expected) {
      return RouterError::kAccountCountMismatch;
    }
    return outcome::success();
  }

  outcome::result<DaySplit> computeDaySplit(
      const Policy &policy,
      TokenAmount claimed,
      const std::vector<TokenAmount> &locked) {
    DaySplit split;
    for (const auto &amount : locked) {
      OUTCOME_TRYA(split.total_locked,
                   math::checkedAdd(split.total_locked, amount));
    }
    split.eligible_bps = math::eligibleShareBps(split.total_locked,
                                                policy.y0_total_allocation,
                                                policy.investor_fee_share_bps);
    OUTCOME_TRYA(
        split.investor_pool,
        math::investorPool(claimed, split.eligible_bps, policy.daily_cap));
    return split;
  }

  DistributionProgress startDay(const DistributionProgress &progress,
                                UnixTime now,
                                TokenAmount claimed,
                                const DaySplit &split) {
    auto next{progress};
    next.day_completed = false;
    next.cursor = 0;
    next.paid.clear();
    next.current_day_total_claimed = claimed;
    next.current_day_distributed = 0;
    next.current_day_start_ts = now;
    next.current_day_total_locked = split.total_locked;
    next.current_day_eligible_bps = split.eligible_bps;
    next.current_day_investor_pool = split.investor_pool;
    return next;
  }

  outcome::result<PageResult> distributePage(
      const Policy &policy,
      const DistributionProgress &progress,
      InvestorIndex page_start,
      const std::vector<TokenAmount> &page_locked,
      UnixTime now) {
    if (progress.day_completed || page_start != progress.cursor) {
      return RouterError::kInvalidPaginationSequence;
    }
    const auto length{pageLength(
        policy, page_start, static_cast<uint32_t>(page_locked.size()))};
    if (length == 0 || length != page_locked.size()) {
      return RouterError::kAccountCountMismatch;
    }

    PageResult result;
    auto &next{result.next};
    next = progress;
    for (uint32_t i = 0; i < length; ++i) {
      const InvestorIndex index{page_start + i};
      if (next.paid.test(index)) {
        continue;
      }
      OUTCOME_TRY(payout,
                  math::investorPayout(next.current_day_investor_pool,
                                       page_locked[i],
                                       next.current_day_total_locked));
      if (payout == 0) {
        continue;
      }
      if (payout < policy.min_payout) {
        result.dust.push_back(index);
        OUTCOME_TRYA(result.dust_amount,
                     math::checkedAdd(result.dust_amount, payout));
        continue;
      }
      OUTCOME_TRY(distributed,
                  math::checkedAdd(next.current_day_distributed, payout));
      if (distributed > next.current_day_investor_pool
          || distributed > next.current_day_total_claimed
          || (policy.daily_cap && distributed > *policy.daily_cap)) {
        return RouterError::kDailyCapExceeded;
      }
      next.current_day_distributed = distributed;
      next.paid.set(index);
      result.payouts.push_back({index, payout});
      OUTCOME_TRYA(result.paid, math::checkedAdd(result.paid, payout));
    }
    next.cursor = page_start + length;

    if (next.cursor == policy.total_investors) {
      OUTCOME_TRY(creator,
                  math::checkedSub(next.current_day_total_claimed,
                                   next.current_day_distributed));
      OUTCOME_TRYA(next.total_investor_distributed,
                   math::checkedAdd(next.total_investor_distributed,
                                    next.current_day_distributed));
      OUTCOME_TRYA(
          next.total_creator_distributed,
          math::checkedAdd(next.total_creator_distributed, creator));
      ++next.total_distributions;
      next.day_completed = true;
      next.cursor = 0;
      next.paid.clear();
      next.last_distribution_ts = now;
      result.creator_payout = creator;
    }
    return result;
  }

  outcome::result<PageResult> runPage(const Policy &policy,
                                      const DistributionProgress &progress,
                                      const PageInput &input) {
    OUTCOME_TRY(admitPage(policy,
                          progress,
                          input.page_start,
                          input.page_size,
                          input.locked.size(),
                          input.now));
    if (progress.cursor != 0) {
      return distributePage(
          policy, progress, input.page_start, input.locked, input.now);
    }

    OUTCOME_TRY(split, computeDaySplit(policy, input.claimed, input.locked));
    const auto started{startDay(progress, input.now, input.claimed, split)};
    const auto length{pageLength(policy, 0, input.page_size)};
    const std::vector<TokenAmount> page_locked(
        input.locked.begin(), input.locked.begin() + length);
    OUTCOME_TRY(result,
                distributePage(policy, started, 0, page_locked, input.now));
    result.day_split = split;
    return std::move(result);
  }
}  // namespace fr::router
