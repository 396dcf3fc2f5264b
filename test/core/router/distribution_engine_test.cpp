/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/distribution_engine.hpp"

#include <gtest/gtest.h>

#include "router/router_error.hpp"
#include "testutil/outcome.hpp"

using fr::router::computeDaySplit;
using fr::router::DaySplit;
using fr::router::distributePage;
using fr::router::DistributionProgress;
using fr::router::initialProgress;
using fr::router::kNeverDistributed;
using fr::router::PageInput;
using fr::router::PageResult;
using fr::router::pageLength;
using fr::router::Policy;
using fr::router::RouterError;
using fr::router::runPage;
using fr::router::startDay;
using fr::router::TokenAmount;
using fr::router::UnixTime;
using fr::clock::kDay;

class DistributionEngineTest : public ::testing::Test {
 public:
  struct DayTotals {
    std::vector<TokenAmount> investors;
    TokenAmount creator{};
    uint32_t pages{};
  };

  PageInput page(uint32_t page_start,
                 uint32_t page_size,
                 const std::vector<TokenAmount> &locked) const {
    PageInput input;
    input.page_start = page_start;
    input.page_size = page_size;
    input.now = now;
    input.claimed = claimed;
    if (page_start == 0) {
      input.locked = locked;
    } else {
      const auto end{std::min<size_t>(page_start + page_size, locked.size())};
      input.locked.assign(locked.begin() + page_start, locked.begin() + end);
    }
    return input;
  }

  /// Cranks pages until the day closes, checking invariants after each page
  DayTotals runDay(const std::vector<TokenAmount> &locked,
                   uint32_t page_size) {
    DayTotals totals;
    totals.investors.resize(locked.size());
    uint32_t page_start{0};
    TokenAmount distributed{0};
    while (totals.pages <= policy.total_investors) {
      auto result{runPage(policy, progress, page(page_start, page_size, locked))};
      EXPECT_TRUE(result) << result.error().message();
      if (!result) {
        break;
      }
      ++totals.pages;
      const auto &next{result.value().next};
      for (const auto &payout : result.value().payouts) {
        totals.investors.at(payout.index) += payout.amount;
      }
      EXPECT_LE(next.current_day_distributed, next.current_day_total_claimed);
      if (policy.daily_cap) {
        EXPECT_LE(next.current_day_distributed, *policy.daily_cap);
      }
      progress = next;
      if (result.value().creator_payout) {
        totals.creator = *result.value().creator_payout;
        EXPECT_TRUE(progress.day_completed);
        EXPECT_EQ(progress.cursor, 0);
        EXPECT_TRUE(progress.paid.none());
        EXPECT_EQ(progress.last_distribution_ts, now);
        break;
      }
      EXPECT_FALSE(progress.day_completed);
      EXPECT_GE(progress.current_day_distributed, distributed);
      EXPECT_GT(progress.cursor, page_start);
      distributed = progress.current_day_distributed;
      page_start = progress.cursor;
    }
    return totals;
  }

  static TokenAmount sum(const std::vector<TokenAmount> &amounts) {
    TokenAmount total{0};
    for (const auto &amount : amounts) {
      total += amount;
    }
    return total;
  }

  Policy policy{"vault", "creator", 10000, boost::none, 0, 1000, 4};
  DistributionProgress progress{initialProgress("vault")};
  UnixTime now{1700000000};
  TokenAmount claimed{1000};
};

/**
 * @given all of Y0 locked and full investor share
 * @when day is distributed
 * @then investors get everything, creator remainder is zero
 */
TEST_F(DistributionEngineTest, AllLocked) {
  const auto totals{runDay({250, 250, 250, 250}, 4)};
  EXPECT_EQ(progress.current_day_eligible_bps, 10000);
  EXPECT_EQ(totals.investors, std::vector<TokenAmount>(4, 250));
  EXPECT_EQ(totals.creator, 0);
  EXPECT_EQ(totals.pages, 1);
}

/**
 * @given nothing locked
 * @when day is distributed
 * @then investors get nothing, creator gets the whole claim
 */
TEST_F(DistributionEngineTest, AllUnlocked) {
  const auto totals{runDay({0, 0, 0, 0}, 2)};
  EXPECT_EQ(progress.current_day_eligible_bps, 0);
  EXPECT_EQ(progress.current_day_investor_pool, 0);
  EXPECT_EQ(sum(totals.investors), 0);
  EXPECT_EQ(totals.creator, claimed);
}

/**
 * @given 5 equal investors, each half locked
 * @when day is distributed
 * @then eligible share is 50%, split equally, creator gets the other half
 */
TEST_F(DistributionEngineTest, HalfLocked) {
  policy.total_investors = 5;
  const auto totals{runDay({100, 100, 100, 100, 100}, 5)};
  EXPECT_EQ(progress.current_day_eligible_bps, 5000);
  EXPECT_EQ(totals.investors, std::vector<TokenAmount>(5, 100));
  EXPECT_EQ(totals.creator, 500);
}

/**
 * @given minimal payout above every investor share
 * @when day is distributed
 * @then nothing is paid, whole investor pool rolls into creator remainder
 */
TEST_F(DistributionEngineTest, Dust) {
  policy.min_payout = 300;
  const auto first{runPage(policy, progress, page(0, 2, {250, 250, 250, 250}))};
  EXPECT_TRUE(first);
  EXPECT_TRUE(first.value().payouts.empty());
  EXPECT_EQ(first.value().dust.size(), 2);
  EXPECT_EQ(first.value().dust_amount, 500);
  EXPECT_EQ(first.value().next.current_day_distributed, 0);
  EXPECT_TRUE(first.value().next.paid.none());

  const auto totals{runDay({250, 250, 250, 250}, 2)};
  EXPECT_EQ(sum(totals.investors), 0);
  EXPECT_EQ(totals.creator, claimed);
}

/**
 * @given 4 investors and pages of 2
 * @when pages are cranked in and out of order
 * @then only the page at the cursor is admitted
 */
TEST_F(DistributionEngineTest, Pagination) {
  const std::vector<TokenAmount> locked{250, 250, 250, 250};
  EXPECT_OUTCOME_TRUE(first, runPage(policy, progress, page(0, 2, locked)));
  EXPECT_FALSE(first.next.day_completed);
  EXPECT_EQ(first.next.cursor, 2);
  EXPECT_FALSE(first.creator_payout);
  progress = first.next;

  // overlap and skip
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(policy, progress, page(1, 2, locked)));
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(policy, progress, page(3, 1, locked)));
  // replay of the first page
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(policy, progress, page(0, 2, locked)));

  EXPECT_OUTCOME_TRUE(second, runPage(policy, progress, page(2, 2, locked)));
  EXPECT_TRUE(second.next.day_completed);
  EXPECT_EQ(second.next.cursor, 0);
  EXPECT_TRUE(second.creator_payout);
  progress = second.next;

  // replay of the last page of a closed day
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(policy, progress, page(2, 2, locked)));
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(policy, progress, page(1, 2, locked)));
}

/**
 * @given 5 investors and pages of 2
 * @when day is distributed
 * @then last page is short and closes the day
 */
TEST_F(DistributionEngineTest, ShortLastPage) {
  policy.total_investors = 5;
  EXPECT_EQ(pageLength(policy, 4, 2), 1);
  EXPECT_EQ(pageLength(policy, 0, 50), 5);
  const auto totals{runDay({200, 200, 200, 200, 200}, 2)};
  EXPECT_EQ(totals.pages, 3);
  EXPECT_EQ(totals.investors, std::vector<TokenAmount>(5, 200));
  EXPECT_EQ(totals.creator, 0);
}

/**
 * @given day in progress at the last page
 * @when page carries more accounts than investors left
 * @then kAccountCountMismatch
 */
TEST_F(DistributionEngineTest, AccountCount) {
  policy.total_investors = 5;
  const std::vector<TokenAmount> locked{200, 200, 200, 200, 200};
  // first page must carry the whole investor set
  auto partial{page(0, 2, locked)};
  partial.locked.resize(2);
  EXPECT_OUTCOME_ERROR(RouterError::kAccountCountMismatch,
                       runPage(policy, progress, partial));

  EXPECT_OUTCOME_TRUE(first, runPage(policy, progress, page(0, 4, locked)));
  progress = first.next;
  auto last{page(4, 2, locked)};
  last.locked.push_back(200);
  EXPECT_OUTCOME_ERROR(RouterError::kAccountCountMismatch,
                       runPage(policy, progress, last));
  EXPECT_OUTCOME_TRUE_1(runPage(policy, progress, page(4, 2, locked)));
}

/// Page size must be within [1, 50]
TEST_F(DistributionEngineTest, PageSize) {
  const std::vector<TokenAmount> locked{250, 250, 250, 250};
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPagination,
                       runPage(policy, progress, page(0, 0, locked)));
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPagination,
                       runPage(policy, progress, page(0, 51, locked)));
  EXPECT_OUTCOME_TRUE_1(runPage(policy, progress, page(0, 50, locked)));
}

/**
 * @given day closed at now
 * @when next day starts before and after 24 hours
 * @then rejected before, admitted after
 */
TEST_F(DistributionEngineTest, Window) {
  EXPECT_EQ(progress.last_distribution_ts, kNeverDistributed);
  const std::vector<TokenAmount> locked{250, 250, 250, 250};
  runDay(locked, 4);
  const auto closed_at{now};

  now = closed_at + kDay - UnixTime{1};
  EXPECT_OUTCOME_ERROR(RouterError::kCrankWindowNotReached,
                       runPage(policy, progress, page(0, 4, locked)));
  now = closed_at + kDay;
  EXPECT_OUTCOME_TRUE(next, runPage(policy, progress, page(0, 4, locked)));
  EXPECT_EQ(next.next.total_distributions, 2);
  EXPECT_EQ(next.next.total_investor_distributed, 2 * claimed);
}

/**
 * @given daily cap below the investor share
 * @when day is distributed
 * @then investors share the cap, creator gets the rest
 */
TEST_F(DistributionEngineTest, DailyCap) {
  policy.daily_cap = 100;
  const auto totals{runDay({250, 250, 250, 250}, 1)};
  EXPECT_EQ(progress.current_day_investor_pool, 100);
  EXPECT_EQ(totals.investors, std::vector<TokenAmount>(4, 25));
  EXPECT_EQ(totals.creator, 900);
}

/**
 * @given shares which do not divide evenly
 * @when day is distributed
 * @then payouts are floored and remainder goes to creator exactly
 */
TEST_F(DistributionEngineTest, Conservation) {
  policy.total_investors = 3;
  policy.y0_total_allocation = 3;
  claimed = 100;
  const auto totals{runDay({1, 1, 1}, 2)};
  EXPECT_EQ(totals.investors, std::vector<TokenAmount>(3, 33));
  EXPECT_EQ(totals.creator, 1);
  EXPECT_EQ(sum(totals.investors) + totals.creator, claimed);
  EXPECT_EQ(progress.total_investor_distributed, 99);
  EXPECT_EQ(progress.total_creator_distributed, 1);
}

/**
 * @given started day with investor already marked paid
 * @when its page is distributed
 * @then investor is skipped
 */
TEST_F(DistributionEngineTest, PaidInvestorSkipped) {
  EXPECT_OUTCOME_TRUE(split, computeDaySplit(policy, claimed, {250, 250, 250, 250}));
  auto started{startDay(progress, now, claimed, split)};
  started.paid.set(1);
  EXPECT_OUTCOME_TRUE(result,
                      distributePage(policy, started, 0, {250, 250}, now));
  ASSERT_EQ(result.payouts.size(), 1);
  EXPECT_EQ(result.payouts[0].index, 0);
  EXPECT_TRUE(result.next.paid.test(0));
  EXPECT_TRUE(result.next.paid.test(1));
}

/**
 * @given started day whose page locked amounts exceed the day total
 * @when page is distributed
 * @then kDailyCapExceeded instead of overpaying
 */
TEST_F(DistributionEngineTest, PoolOverrun) {
  DaySplit split{500, 10000, 1000};
  const auto started{startDay(progress, now, claimed, split)};
  EXPECT_OUTCOME_ERROR(
      RouterError::kDailyCapExceeded,
      distributePage(policy, started, 0, {500, 500, 500, 500}, now));
}

/// Sum of locked amounts which overflows is rejected
TEST_F(DistributionEngineTest, LockedOverflow) {
  const auto max{std::numeric_limits<TokenAmount>::max()};
  EXPECT_OUTCOME_ERROR(RouterError::kMathOverflow,
                       computeDaySplit(policy, claimed, {max, 1}));
}
