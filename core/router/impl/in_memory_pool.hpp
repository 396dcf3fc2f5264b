/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include "router/fee_source.hpp"
#include "router/token_ledger.hpp"

namespace fr::router {
  enum class PoolError {
    kPoolNotFound = 1,
    kPoolAlreadyExists,
    kPositionNotFound,
    kPositionPoolMismatch,
    kInvalidRecord,
  };

  /**
   * Pool simulation keeping pools and positions in the key-value state.
   * Accrued fees are held by the pool fee vault account until claimed.
   */
  class InMemoryPool : public FeeSource {
   public:
    explicit InMemoryPool(std::shared_ptr<TokenLedger> ledger);

    outcome::result<void> createPool(storage::BufferMap &state,
                                     const PoolConfig &config);

    /**
     * Credits trading fees to a position
     */
    outcome::result<void> accrueFees(storage::BufferMap &state,
                                     const PositionId &position,
                                     TokenAmount amount_a,
                                     TokenAmount amount_b);

    /// Account escrowing fees accrued to a position until they are claimed
    static AccountId feeVault(const PositionId &position);

    outcome::result<PoolConfig> poolConfig(const storage::BufferMap &state,
                                           const PoolId &pool) const override;

    outcome::result<PositionId> openPosition(storage::BufferMap &state,
                                             const PoolId &pool,
                                             const AccountId &owner) override;

    outcome::result<AccountId> positionOwner(
        const storage::BufferMap &state,
        const PositionId &position) const override;

    outcome::result<ClaimedFees> claim(storage::BufferMap &state,
                                       const HonoraryPosition &position,
                                       const AccountId &recipient) override;

   private:
    struct PositionRecord {
      PoolId pool;
      AccountId owner;
      TokenAmount accrued_a{};
      TokenAmount accrued_b{};
    };

    outcome::result<PositionRecord> loadPosition(
        const storage::BufferMap &state, const PositionId &position) const;

    outcome::result<void> savePosition(storage::BufferMap &state,
                                       const PositionId &position,
                                       const PositionRecord &record);

    std::shared_ptr<TokenLedger> ledger_;
  };
}  // namespace fr::router

OUTCOME_HPP_DECLARE_ERROR(fr::router, PoolError);
