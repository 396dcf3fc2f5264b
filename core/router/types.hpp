/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>

#include "clock/time.hpp"

namespace fr::router {
  using clock::UnixTime;

  /// Distribution unit grouping one policy, progress and honorary position
  using VaultId = std::string;

  /// Token account able to hold and receive an asset
  using AccountId = std::string;

  /// Token mint
  using AssetId = std::string;

  using PoolId = std::string;

  /// Handle of a liquidity position inside a pool
  using PositionId = std::string;

  /// Vesting stream of one investor, as known to the vesting system
  using StreamId = std::string;

  /// Smallest unit of the designated asset
  using TokenAmount = uint64_t;

  using BasisPoints = uint16_t;

  /// Position of an investor within the fixed investor set of a vault
  using InvestorIndex = uint32_t;

  /**
   * One investor as supplied to a crank page
   */
  struct InvestorAccount {
    /// vesting stream queried for the locked amount
    StreamId stream;
    /// destination of the payout
    AccountId wallet;
  };

  inline bool operator==(const InvestorAccount &lhs,
                         const InvestorAccount &rhs) {
    return lhs.stream == rhs.stream && lhs.wallet == rhs.wallet;
  }
}  // namespace fr::router
