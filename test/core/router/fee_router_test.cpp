/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/impl/fee_router_impl.hpp"

#include <gtest/gtest.h>
#include <boost/optional/optional_io.hpp>
#include <algorithm>
#include <map>
#include <thread>

#include "clock/impl/manual_clock.hpp"
#include "router/addresses.hpp"
#include "router/impl/buffer_token_ledger.hpp"
#include "router/impl/in_memory_pool.hpp"
#include "router/router_error.hpp"
#include "storage/in_memory/in_memory_storage.hpp"
#include "testutil/mocks/router/fee_source_mock.hpp"
#include "testutil/mocks/router/vesting_oracle_mock.hpp"
#include "testutil/outcome.hpp"

using fr::clock::kDay;
using fr::clock::ManualClock;
using fr::router::AccountId;
using fr::router::BufferTokenLedger;
using fr::router::ClaimedFees;
using fr::router::CollectFeeMode;
using fr::router::DistributionProgress;
using fr::router::FeeRouterImpl;
using fr::router::FeeSourceMock;
using fr::router::InMemoryPool;
using fr::router::InvestorAccount;
using fr::router::InvestorIndex;
using fr::router::Policy;
using fr::router::PoolConfig;
using fr::router::PoolStatus;
using fr::router::positionOwnerAccount;
using fr::router::RouterError;
using fr::router::StreamId;
using fr::router::TokenAmount;
using fr::router::treasuryAccount;
using fr::router::UnixTime;
using fr::router::VestingOracleMock;
using fr::storage::InMemoryStorage;
using fr::router::events::Connection;
using fr::router::events::CreatorPayoutDayClosed;
using fr::router::events::Events;
using fr::router::events::InvestorPayoutPage;
using fr::router::events::PolicySetup;
using fr::router::events::QuoteFeesClaimed;
using testing::_;
using testing::Invoke;
using testing::NiceMock;
using testing::Return;

namespace outcome = fr::outcome;

static const std::string kQuote{"QUOTE"};
static const std::string kBase{"BASE"};

class FeeRouterTest : public ::testing::Test {
 public:
  void SetUp() override {
    ON_CALL(*vesting, locked(_, _))
        .WillByDefault(Invoke([this](const StreamId &stream, UnixTime)
                                  -> outcome::result<TokenAmount> {
          const auto it{locked.find(stream)};
          if (it == locked.end()) {
            return RouterError::kInsufficientVestingData;
          }
          return it->second;
        }));
    connections.emplace_back(events->subscribePolicySetup(
        [this](const PolicySetup &) { ++policy_events; }));
    connections.emplace_back(events->subscribeQuoteFeesClaimed(
        [this](const QuoteFeesClaimed &e) { claim_events.push_back(e); }));
    connections.emplace_back(events->subscribeInvestorPayoutPage(
        [this](const InvestorPayoutPage &e) { page_events.push_back(e); }));
    connections.emplace_back(events->subscribeCreatorPayoutDayClosed(
        [this](const CreatorPayoutDayClosed &e) { close_events.push_back(e); }));

    PoolConfig config{
        "pool", kBase, kQuote, CollectFeeMode::kOnlyB, PoolStatus::kEnabled};
    EXPECT_OUTCOME_TRUE_1(pool->createPool(*db, config));
  }

  /// Vault with n investors each with the given locked amount
  void setupVault(uint32_t n, TokenAmount each_locked) {
    policy.total_investors = n;
    for (uint32_t i = 0; i < n; ++i) {
      const auto stream{"stream" + std::to_string(i)};
      investors.push_back({stream, "wallet" + std::to_string(i)});
      locked[stream] = each_locked;
    }
    EXPECT_OUTCOME_TRUE_1(router->setupPolicy(policy));
    EXPECT_OUTCOME_TRUE(position,
                        router->initializePosition(policy.vault, "pool", kQuote));
    position_id = position.position;
  }

  void accrue(TokenAmount quote, TokenAmount base = 0) {
    EXPECT_OUTCOME_TRUE_1(pool->accrueFees(*db, position_id, base, quote));
  }

  std::vector<InvestorAccount> page(InvestorIndex start, uint32_t size) const {
    if (start == 0) {
      return investors;
    }
    const auto end{std::min<size_t>(start + size, investors.size())};
    return {investors.begin() + start, investors.begin() + end};
  }

  auto runPage(InvestorIndex start, uint32_t size) {
    return router->runPage(policy.vault, start, size, page(start, size));
  }

  TokenAmount balance(const AccountId &account) const {
    return ledger->balance(*db, kQuote, account).value();
  }

  TokenAmount investorBalance(size_t i) const {
    return balance(investors.at(i).wallet);
  }

  DistributionProgress progress() const {
    return router->getProgress(policy.vault).value();
  }

  std::shared_ptr<InMemoryStorage> db{std::make_shared<InMemoryStorage>()};
  std::shared_ptr<BufferTokenLedger> ledger{
      std::make_shared<BufferTokenLedger>()};
  std::shared_ptr<InMemoryPool> pool{std::make_shared<InMemoryPool>(ledger)};
  std::shared_ptr<NiceMock<VestingOracleMock>> vesting{
      std::make_shared<NiceMock<VestingOracleMock>>()};
  std::shared_ptr<ManualClock> clock{
      std::make_shared<ManualClock>(UnixTime{1700000000})};
  std::shared_ptr<Events> events{std::make_shared<Events>()};
  std::shared_ptr<FeeRouterImpl> router{std::make_shared<FeeRouterImpl>(
      db, pool, vesting, ledger, clock, events)};

  Policy policy{"vault", "creator", 10000, boost::none, 0, 1000, 0};
  std::vector<InvestorAccount> investors;
  std::map<StreamId, TokenAmount> locked;
  std::string position_id;

  std::vector<Connection> connections;
  int policy_events{0};
  std::vector<QuoteFeesClaimed> claim_events;
  std::vector<InvestorPayoutPage> page_events;
  std::vector<CreatorPayoutDayClosed> close_events;
};

/**
 * @given invalid policy parameters
 * @when setup
 * @then rejected and no state created
 */
TEST_F(FeeRouterTest, SetupRejectsInvalid) {
  policy.total_investors = 4;
  policy.investor_fee_share_bps = 10001;
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidFeeShare,
                       router->setupPolicy(policy));
  policy.investor_fee_share_bps = 5000;
  policy.y0_total_allocation = 0;
  EXPECT_OUTCOME_ERROR(RouterError::kZeroTotalAllocation,
                       router->setupPolicy(policy));

  EXPECT_OUTCOME_ERROR(RouterError::kPolicyNotFound,
                       router->getPolicy(policy.vault));
  EXPECT_OUTCOME_ERROR(RouterError::kPolicyNotFound,
                       router->getProgress(policy.vault));
  EXPECT_EQ(policy_events, 0);
}

/**
 * @given vault with policy
 * @when setup repeated with other parameters
 * @then rejected, original policy kept
 */
TEST_F(FeeRouterTest, SetupOnce) {
  policy.total_investors = 4;
  EXPECT_OUTCOME_TRUE_1(router->setupPolicy(policy));
  auto other{policy};
  other.investor_fee_share_bps = 1;
  EXPECT_OUTCOME_ERROR(RouterError::kPolicyAlreadyExists,
                       router->setupPolicy(other));
  EXPECT_OUTCOME_EQ(router->getPolicy(policy.vault), policy);
  EXPECT_TRUE(progress().day_completed);
  EXPECT_EQ(policy_events, 1);
}

/**
 * @given pools with different collection modes
 * @when honorary position is initialized
 * @then only a quote-only pool is accepted, once per vault
 */
TEST_F(FeeRouterTest, InitializePosition) {
  PoolConfig both{"both", kBase, kQuote, CollectFeeMode::kBothToken,
                  PoolStatus::kEnabled};
  EXPECT_OUTCOME_TRUE_1(pool->createPool(*db, both));
  EXPECT_OUTCOME_ERROR(RouterError::kQuoteOnlyValidationFailed,
                       router->initializePosition("vault", "both", kQuote));
  EXPECT_OUTCOME_ERROR(RouterError::kQuoteOnlyValidationFailed,
                       router->initializePosition("vault", "pool", kBase));
  EXPECT_OUTCOME_ERROR(RouterError::kPositionNotFound,
                       router->getPosition("vault"));

  EXPECT_OUTCOME_TRUE(position,
                      router->initializePosition("vault", "pool", kQuote));
  EXPECT_EQ(position.owner, positionOwnerAccount("vault"));
  EXPECT_EQ(position.base_asset, kBase);
  EXPECT_OUTCOME_EQ(pool->positionOwner(*db, position.position),
                    positionOwnerAccount("vault"));
  EXPECT_OUTCOME_ERROR(RouterError::kPositionAlreadyExists,
                       router->initializePosition("vault", "pool", kQuote));
}

/**
 * @given every investor fully locked and full fee share
 * @when day is cranked
 * @then investors receive all fees, creator nothing
 */
TEST_F(FeeRouterTest, AllLocked) {
  setupVault(4, 250);
  accrue(1000);
  EXPECT_OUTCOME_TRUE(report, runPage(0, 4));
  EXPECT_TRUE(report.day_completed);
  EXPECT_EQ(report.claimed, TokenAmount{1000});
  EXPECT_EQ(report.creator_payout, TokenAmount{0});
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(investorBalance(i), 250);
  }
  EXPECT_EQ(balance("creator"), 0);
  EXPECT_EQ(balance(treasuryAccount(policy.vault)), 0);
  ASSERT_EQ(claim_events.size(), 1);
  EXPECT_EQ(claim_events[0].amount, 1000);
  ASSERT_EQ(close_events.size(), 1);
  EXPECT_EQ(close_events[0].investors_distributed, 1000);
}

/**
 * @given nothing locked
 * @when day is cranked
 * @then creator receives the whole claim
 */
TEST_F(FeeRouterTest, AllUnlocked) {
  setupVault(4, 0);
  accrue(1000);
  EXPECT_OUTCOME_TRUE_1(runPage(0, 2));
  EXPECT_OUTCOME_TRUE_1(runPage(2, 2));
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(investorBalance(i), 0);
  }
  EXPECT_EQ(balance("creator"), 1000);
}

/**
 * @given 5 investors half locked
 * @when day is cranked
 * @then half of the fees shared equally, other half to creator
 */
TEST_F(FeeRouterTest, HalfLocked) {
  setupVault(5, 100);
  accrue(1000);
  EXPECT_OUTCOME_TRUE_1(runPage(0, 5));
  for (size_t i = 0; i < 5; ++i) {
    EXPECT_EQ(investorBalance(i), 100);
  }
  EXPECT_EQ(balance("creator"), 500);
}

/**
 * @given minimal payout above every share
 * @when day is cranked
 * @then nothing transferred to investors, creator gets the whole claim
 */
TEST_F(FeeRouterTest, Dust) {
  policy.min_payout = 300;
  setupVault(4, 250);
  accrue(1000);
  EXPECT_OUTCOME_TRUE(first, runPage(0, 2));
  EXPECT_EQ(first.paid, 0);
  EXPECT_EQ(first.dust, 500);
  EXPECT_EQ(progress().current_day_distributed, 0);
  EXPECT_OUTCOME_TRUE_1(runPage(2, 2));
  EXPECT_EQ(balance("creator"), 1000);
  EXPECT_EQ(balance(treasuryAccount(policy.vault)), 0);
}

/**
 * @given daily cap
 * @when day is cranked in single investor pages
 * @then investors never exceed the cap
 */
TEST_F(FeeRouterTest, DailyCap) {
  policy.daily_cap = 100;
  setupVault(4, 250);
  accrue(1000);
  InvestorIndex start{0};
  for (int i = 0; i < 4; ++i) {
    EXPECT_OUTCOME_TRUE(report, runPage(start, 1));
    EXPECT_LE(progress().current_day_distributed, 100);
    start = report.cursor;
  }
  EXPECT_EQ(balance("creator"), 900);
  EXPECT_EQ(investorBalance(3), 25);
}

/**
 * @given 4 investors, pages of 2
 * @when pages are cranked with wrong starts
 * @then sequence violation, no effect; correct pages complete the day
 */
TEST_F(FeeRouterTest, Pagination) {
  setupVault(4, 250);
  accrue(1000);
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(1, 2));
  EXPECT_OUTCOME_TRUE(first, runPage(0, 2));
  EXPECT_FALSE(first.day_completed);
  EXPECT_EQ(first.cursor, 2);

  const auto before{progress()};
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(1, 2));
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(3, 1));
  EXPECT_EQ(progress(), before);

  EXPECT_OUTCOME_TRUE(second, runPage(2, 2));
  EXPECT_TRUE(second.day_completed);
  EXPECT_EQ(second.cursor, 0);
  EXPECT_EQ(page_events.size(), 2);
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(1, 2));
}

/**
 * @given subscriber cranking the next page from the page event
 * @when first page is cranked
 * @then the chained page runs after the first one commits, the day closes
 */
TEST_F(FeeRouterTest, CrankFromPageEvent) {
  setupVault(4, 250);
  accrue(1000);
  std::vector<outcome::result<fr::router::PageReport>> chained;
  auto connection{events->subscribeInvestorPayoutPage(
      [&](const InvestorPayoutPage &e) {
        if (e.page_start == 0) {
          chained.push_back(runPage(2, 2));
        }
      })};

  EXPECT_OUTCOME_TRUE(first, runPage(0, 2));
  EXPECT_EQ(first.cursor, 2);
  ASSERT_EQ(chained.size(), 1);
  EXPECT_OUTCOME_TRUE(second, chained[0]);
  EXPECT_TRUE(second.day_completed);
  for (auto i{0}; i < 4; ++i) {
    EXPECT_EQ(investorBalance(i), 250);
  }
  EXPECT_EQ(page_events.size(), 2);
  EXPECT_EQ(close_events.size(), 1);
  EXPECT_EQ(progress().cursor, 0);
}

/**
 * @given first page committed
 * @when identical page is submitted again
 * @then rejected, nobody is paid twice
 */
TEST_F(FeeRouterTest, ExactResubmissionRejected) {
  setupVault(4, 250);
  accrue(1000);
  EXPECT_OUTCOME_TRUE_1(runPage(0, 2));
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(0, 2));
  EXPECT_EQ(investorBalance(0), 250);
  EXPECT_EQ(investorBalance(1), 250);

  EXPECT_OUTCOME_TRUE_1(runPage(2, 2));
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPaginationSequence,
                       runPage(2, 2));
  EXPECT_EQ(investorBalance(2), 250);
  EXPECT_EQ(investorBalance(3), 250);
}

/**
 * @given position which accrued fees in the base asset
 * @when first page is cranked
 * @then page aborted with claim, transfers and progress discarded
 */
TEST_F(FeeRouterTest, BaseFeesAbortPage) {
  setupVault(4, 250);
  accrue(1000, 1);
  const auto before{progress()};
  EXPECT_OUTCOME_ERROR(RouterError::kBaseFeesDetected, runPage(0, 4));
  EXPECT_EQ(progress(), before);
  EXPECT_EQ(balance(treasuryAccount(policy.vault)), 0);
  EXPECT_EQ(balance(InMemoryPool::feeVault(position_id)), 1000);
  EXPECT_EQ(router->getPosition(policy.vault).value().total_fees_claimed, 0);
  EXPECT_TRUE(claim_events.empty());
  EXPECT_TRUE(page_events.empty());
}

/**
 * @given investor stream which can not be read
 * @when first page is cranked
 * @then page aborted, fees stay claimable
 */
TEST_F(FeeRouterTest, VestingFailureAbortsPage) {
  setupVault(4, 250);
  accrue(1000);
  locked.erase("stream3");
  EXPECT_OUTCOME_ERROR(RouterError::kInsufficientVestingData, runPage(0, 2));
  EXPECT_EQ(balance(InMemoryPool::feeVault(position_id)), 1000);
  EXPECT_TRUE(progress().day_completed);

  locked["stream3"] = 250;
  EXPECT_OUTCOME_TRUE(report, runPage(0, 2));
  EXPECT_EQ(report.claimed, TokenAmount{1000});
}

/**
 * @given day closed
 * @when next day is cranked before and after 24 hours
 * @then window violation, then new day with new claim
 */
TEST_F(FeeRouterTest, Window) {
  setupVault(4, 250);
  accrue(1000);
  EXPECT_OUTCOME_TRUE_1(runPage(0, 4));

  accrue(400);
  clock->advance(kDay - UnixTime{1});
  EXPECT_OUTCOME_ERROR(RouterError::kCrankWindowNotReached, runPage(0, 4));
  clock->advance(UnixTime{1});
  EXPECT_OUTCOME_TRUE(report, runPage(0, 4));
  EXPECT_EQ(report.claimed, TokenAmount{400});
  EXPECT_EQ(investorBalance(0), 350);

  const auto state{progress()};
  EXPECT_EQ(state.total_distributions, 2);
  EXPECT_EQ(state.total_investor_distributed, 1400);
  EXPECT_EQ(state.total_creator_distributed, 0);
  EXPECT_EQ(router->getPosition(policy.vault).value().total_fees_claimed,
            1400);
}

/**
 * @given vault and unknown vault
 * @when cranking unknown vault
 * @then policy not found
 */
TEST_F(FeeRouterTest, UnknownVault) {
  EXPECT_OUTCOME_ERROR(RouterError::kPolicyNotFound,
                       router->runPage("missing", 0, 1, {}));
  policy.total_investors = 1;
  EXPECT_OUTCOME_TRUE_1(router->setupPolicy(policy));
  EXPECT_OUTCOME_ERROR(RouterError::kPositionNotFound,
                       router->runPage(policy.vault, 0, 1, {}));
}

/**
 * @given two callers cranking the same first page concurrently
 * @when both finish
 * @then exactly one page committed, nobody paid twice
 */
TEST_F(FeeRouterTest, ConcurrentCrank) {
  setupVault(4, 250);
  accrue(1000);
  outcome::result<fr::router::PageReport> r1{RouterError::kMathOverflow};
  outcome::result<fr::router::PageReport> r2{RouterError::kMathOverflow};
  std::thread t1{[&] { r1 = runPage(0, 2); }};
  std::thread t2{[&] { r2 = runPage(0, 2); }};
  t1.join();
  t2.join();
  EXPECT_NE(r1.has_value(), r2.has_value());
  const auto &failed{r1 ? r2 : r1};
  EXPECT_EQ(failed.error(),
            make_error_code(RouterError::kInvalidPaginationSequence));
  EXPECT_EQ(investorBalance(0), 250);
  EXPECT_EQ(progress().cursor, 2);
}

/// Vaults keep separate state
TEST_F(FeeRouterTest, IndependentVaults) {
  setupVault(2, 500);
  auto other{policy};
  other.vault = "other";
  EXPECT_OUTCOME_TRUE_1(router->setupPolicy(other));
  EXPECT_OUTCOME_TRUE_1(router->initializePosition("other", "pool", kQuote));
  accrue(1000);
  EXPECT_OUTCOME_TRUE_1(runPage(0, 1));
  EXPECT_OUTCOME_TRUE(state, router->getProgress("other"));
  EXPECT_TRUE(state.day_completed);
  EXPECT_EQ(progress().cursor, 1);
  EXPECT_OUTCOME_TRUE(report,
                      router->runPage("other", 0, 2, investors));
  EXPECT_EQ(report.claimed, TokenAmount{0});
  EXPECT_EQ(report.creator_payout, TokenAmount{0});
}

/**
 * @given position reported with a foreign owner
 * @when first page is cranked
 * @then ownership violation before any claim
 */
TEST(FeeRouterOwnershipTest, ForeignOwner) {
  auto db{std::make_shared<InMemoryStorage>()};
  auto fee_source{std::make_shared<FeeSourceMock>()};
  auto vesting{std::make_shared<NiceMock<VestingOracleMock>>()};
  FeeRouterImpl router{db,
                       fee_source,
                       vesting,
                       std::make_shared<BufferTokenLedger>(),
                       std::make_shared<ManualClock>(UnixTime{0}),
                       std::make_shared<Events>()};

  PoolConfig config{
      "pool", kBase, kQuote, CollectFeeMode::kOnlyB, PoolStatus::kEnabled};
  EXPECT_CALL(*fee_source, poolConfig(_, "pool")).WillOnce(Return(config));
  EXPECT_CALL(*fee_source, openPosition(_, "pool", positionOwnerAccount("v")))
      .WillOnce(Return(outcome::result<std::string>{"position"}));
  EXPECT_CALL(*fee_source, positionOwner(_, "position"))
      .WillOnce(Return(outcome::result<AccountId>{"thief"}));
  EXPECT_CALL(*fee_source, claim(_, _, _)).Times(0);

  Policy policy{"v", "creator", 10000, boost::none, 0, 1000, 1};
  EXPECT_OUTCOME_TRUE_1(router.setupPolicy(policy));
  EXPECT_OUTCOME_TRUE_1(router.initializePosition("v", "pool", kQuote));
  const std::vector<InvestorAccount> investors{{"s", "w"}};
  EXPECT_OUTCOME_ERROR(RouterError::kInvalidPositionOwnership,
                       router.runPage("v", 0, 1, investors));
}
