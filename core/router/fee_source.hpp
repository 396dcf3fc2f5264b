/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "router/position.hpp"
#include "storage/buffer_map.hpp"

namespace fr::router {
  /**
   * Liquidity pool accruing trading fees for positions.
   * Effectful calls operate on the state of the current page, so their
   * effects are committed or discarded together with the page.
   */
  class FeeSource {
   public:
    virtual ~FeeSource() = default;

    virtual outcome::result<PoolConfig> poolConfig(
        const storage::BufferMap &state, const PoolId &pool) const = 0;

    /**
     * Opens a fee-only position owned by owner
     * @return handle of the new position
     */
    virtual outcome::result<PositionId> openPosition(storage::BufferMap &state,
                                                     const PoolId &pool,
                                                     const AccountId &owner) = 0;

    virtual outcome::result<AccountId> positionOwner(
        const storage::BufferMap &state, const PositionId &position) const = 0;

    /**
     * Drains fees accrued by the position since the previous claim and pays
     * them to recipient
     * @return claimed amounts in the designated and the other asset
     */
    virtual outcome::result<ClaimedFees> claim(
        storage::BufferMap &state,
        const HonoraryPosition &position,
        const AccountId &recipient) = 0;
  };
}  // namespace fr::router
