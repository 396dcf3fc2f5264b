/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "router/types.hpp"

namespace fr::router {
  /// Which of the pool assets trading fees are collected in
  enum class CollectFeeMode : uint8_t {
    kBothToken = 0,
    kOnlyB = 1,
    kOnlyA = 2,
  };

  enum class PoolStatus : uint8_t {
    kEnabled = 0,
    kDisabled = 1,
  };

  /**
   * Pool configuration relevant for fee collection
   */
  struct PoolConfig {
    PoolId pool;
    AssetId token_a;
    AssetId token_b;
    CollectFeeMode collect_fee_mode{CollectFeeMode::kBothToken};
    PoolStatus status{PoolStatus::kEnabled};
  };

  /**
   * Fee-only position owned by the vault. Fees accrue in quote_asset only.
   */
  struct HonoraryPosition {
    VaultId vault;
    PoolId pool;
    /// designated asset, the only one distributed
    AssetId quote_asset;
    AssetId base_asset;
    PositionId position;
    AccountId owner;
    TokenAmount total_fees_claimed{};
  };

  inline bool operator==(const HonoraryPosition &lhs,
                         const HonoraryPosition &rhs) {
    return lhs.vault == rhs.vault && lhs.pool == rhs.pool
           && lhs.quote_asset == rhs.quote_asset
           && lhs.base_asset == rhs.base_asset && lhs.position == rhs.position
           && lhs.owner == rhs.owner
           && lhs.total_fees_claimed == rhs.total_fees_claimed;
  }

  /**
   * Result of one fee claim, split by denomination
   */
  struct ClaimedFees {
    TokenAmount quote{};
    TokenAmount base{};
  };
}  // namespace fr::router
