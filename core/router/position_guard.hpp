/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "router/position.hpp"

namespace fr::router {
  /**
   * Asset the pool collects fees in.
   * @return kQuoteOnlyValidationFailed for pools collecting both assets,
   * kInvalidPoolConfiguration for unknown modes
   */
  outcome::result<AssetId> feeCollectionAsset(const PoolConfig &pool);

  /**
   * Validates a pool before an honorary position is opened in it: the pool
   * must be enabled, must collect fees in exactly one asset, and that asset
   * must be quote_asset. Both asset orderings are accepted.
   * @return asset which must never accrue fees
   */
  outcome::result<AssetId> checkQuoteOnlyPool(const PoolConfig &pool,
                                              const AssetId &quote_asset);

  /// kInvalidPositionOwnership unless owner is the expected one
  outcome::result<void> checkPositionOwnership(const AccountId &expected,
                                               const AccountId &actual);

  /// kBaseFeesDetected if any fee accrued in the base asset
  outcome::result<void> checkClaim(const ClaimedFees &claimed);
}  // namespace fr::router
