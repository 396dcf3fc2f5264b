/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/main/simulator.hpp"

#include "common/logger.hpp"
#include "router/impl/fee_router_impl.hpp"

namespace fr::router::sim {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("simulator");
      return logger.get();
    }
  }  // namespace

  Simulator::Simulator(Config config)
      : config_{std::move(config)},
        storage_{std::make_shared<storage::InMemoryStorage>()},
        clock_{std::make_shared<clock::ManualClock>(config_.start_time)},
        ledger_{std::make_shared<BufferTokenLedger>()},
        pool_{std::make_shared<InMemoryPool>(ledger_)},
        vesting_{std::make_shared<LinearVestingOracle>()},
        events_{std::make_shared<events::Events>()},
        router_{std::make_shared<FeeRouterImpl>(
            storage_, pool_, vesting_, ledger_, clock_, events_)} {}

  StreamId Simulator::streamOf(const InvestorConfig &investor) {
    return "stream/" + investor.wallet;
  }

  outcome::result<void> Simulator::setup() {
    PoolConfig pool;
    pool.pool = config_.pool;
    pool.token_a = config_.token_a;
    pool.token_b = config_.token_b;
    pool.collect_fee_mode =
        CollectFeeMode{static_cast<uint8_t>(config_.collect_fee_mode)};
    pool.status = PoolStatus::kEnabled;
    OUTCOME_TRY(pool_->createPool(*storage_, pool));

    for (const auto &investor : config_.investors) {
      LinearStream stream;
      stream.deposited = investor.deposited;
      stream.start = config_.start_time + investor.start_day * clock::kDay;
      stream.cliff = stream.start;
      stream.end = config_.start_time + investor.end_day * clock::kDay;
      OUTCOME_TRY(vesting_->addStream(streamOf(investor), stream));
    }

    Policy policy;
    policy.vault = config_.vault;
    policy.creator_wallet = config_.creator_wallet;
    policy.investor_fee_share_bps = config_.investor_fee_share_bps;
    policy.daily_cap = config_.daily_cap;
    policy.min_payout = config_.min_payout;
    OUTCOME_TRYA(policy.y0_total_allocation, config_.totalAllocation());
    policy.total_investors = static_cast<uint32_t>(config_.investors.size());
    OUTCOME_TRY(router_->setupPolicy(policy));
    OUTCOME_TRY(router_->initializePosition(
        config_.vault, config_.pool, config_.quote_asset));
    return outcome::success();
  }

  outcome::result<DayResult> Simulator::runDay() {
    if (day_ != 0) {
      clock_->advance(clock::kDay);
    }
    DayResult result;
    result.day = day_;

    OUTCOME_TRY(position, router_->getPosition(config_.vault));
    const auto quote_is_a{position.quote_asset == config_.token_a};
    OUTCOME_TRY(pool_->accrueFees(
        *storage_,
        position.position,
        quote_is_a ? config_.quote_fees_per_day : config_.base_fees_per_day,
        quote_is_a ? config_.base_fees_per_day : config_.quote_fees_per_day));

    std::vector<InvestorAccount> all;
    for (const auto &investor : config_.investors) {
      all.push_back({streamOf(investor), investor.wallet});
    }

    InvestorIndex page_start{0};
    while (true) {
      std::vector<InvestorAccount> page;
      if (page_start == 0) {
        page = all;
      } else {
        const auto end{std::min<size_t>(page_start + config_.page_size,
                                        all.size())};
        page.assign(all.begin() + page_start, all.begin() + end);
      }
      OUTCOME_TRY(report,
                  router_->runPage(
                      config_.vault, page_start, config_.page_size, page));
      ++result.pages;
      if (report.claimed) {
        result.claimed = *report.claimed;
      }
      result.investors_distributed += report.paid;
      if (report.day_completed) {
        result.creator_payout = report.creator_payout.value_or(0);
        break;
      }
      page_start = report.cursor;
    }
    log()->info("day {} closed in {} pages: claimed {}, investors {}, creator {}",
                result.day,
                result.pages,
                result.claimed,
                result.investors_distributed,
                result.creator_payout);
    ++day_;
    return result;
  }

  outcome::result<TokenAmount> Simulator::balance(
      const AccountId &account) const {
    return ledger_->balance(*storage_, config_.quote_asset, account);
  }
}  // namespace fr::router::sim
