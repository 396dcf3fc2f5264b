/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "clock/impl/manual_clock.hpp"
#include "router/events.hpp"
#include "router/fee_router.hpp"
#include "router/impl/buffer_token_ledger.hpp"
#include "router/impl/in_memory_pool.hpp"
#include "router/impl/linear_vesting_oracle.hpp"
#include "router/main/config.hpp"
#include "storage/in_memory/in_memory_storage.hpp"

namespace fr::router::sim {
  struct DayResult {
    uint32_t day{};
    uint32_t pages{};
    TokenAmount claimed{};
    TokenAmount investors_distributed{};
    TokenAmount creator_payout{};
  };

  /**
   * Runs one vault on the in-memory substrate, one crank sequence per day
   */
  class Simulator {
   public:
    explicit Simulator(Config config);

    /// Creates pool, vesting streams, policy and honorary position
    outcome::result<void> setup();

    /// Accrues a day of fees and cranks pages until the day is closed
    outcome::result<DayResult> runDay();

    outcome::result<TokenAmount> balance(const AccountId &account) const;

    const Config &config() const {
      return config_;
    }

    std::shared_ptr<events::Events> events() const {
      return events_;
    }

   private:
    static StreamId streamOf(const InvestorConfig &investor);

    Config config_;
    uint32_t day_{0};
    std::shared_ptr<storage::InMemoryStorage> storage_;
    std::shared_ptr<clock::ManualClock> clock_;
    std::shared_ptr<BufferTokenLedger> ledger_;
    std::shared_ptr<InMemoryPool> pool_;
    std::shared_ptr<LinearVestingOracle> vesting_;
    std::shared_ptr<events::Events> events_;
    std::shared_ptr<FeeRouter> router_;
  };
}  // namespace fr::router::sim
