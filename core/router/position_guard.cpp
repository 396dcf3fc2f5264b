/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/position_guard.hpp"

#include "router/router_error.hpp"

namespace fr::router {
  outcome::result<AssetId> feeCollectionAsset(const PoolConfig &pool) {
    switch (pool.collect_fee_mode) {
      case CollectFeeMode::kOnlyA:
        return pool.token_a;
      case CollectFeeMode::kOnlyB:
        return pool.token_b;
      case CollectFeeMode::kBothToken:
        return RouterError::kQuoteOnlyValidationFailed;
    }
    return RouterError::kInvalidPoolConfiguration;
  }

  outcome::result<AssetId> checkQuoteOnlyPool(const PoolConfig &pool,
                                              const AssetId &quote_asset) {
    OUTCOME_TRY(fee_asset, feeCollectionAsset(pool));
    if (pool.status != PoolStatus::kEnabled) {
      return RouterError::kInvalidPoolConfiguration;
    }
    if (quote_asset != pool.token_a && quote_asset != pool.token_b) {
      return RouterError::kInvalidPoolConfiguration;
    }
    if (pool.token_a == pool.token_b) {
      return RouterError::kInvalidPoolConfiguration;
    }
    if (fee_asset != quote_asset) {
      return RouterError::kQuoteOnlyValidationFailed;
    }
    return quote_asset == pool.token_a ? pool.token_b : pool.token_a;
  }

  outcome::result<void> checkPositionOwnership(const AccountId &expected,
                                               const AccountId &actual) {
    if (expected != actual) {
      return RouterError::kInvalidPositionOwnership;
    }
    return outcome::success();
  }

  outcome::result<void> checkClaim(const ClaimedFees &claimed) {
    if (claimed.base != 0) {
      return RouterError::kBaseFeesDetected;
    }
    return outcome::success();
  }
}  // namespace fr::router
