/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "router/types.hpp"
#include "storage/buffer_map.hpp"

namespace fr::router {
  enum class TokenLedgerError {
    kInsufficientBalance = 1,
    kBalanceOverflow,
    kInvalidBalance,
  };

  /**
   * Token balances and transfers of the execution substrate
   */
  class TokenLedger {
   public:
    virtual ~TokenLedger() = default;

    virtual outcome::result<TokenAmount> balance(
        const storage::BufferMap &state,
        const AssetId &asset,
        const AccountId &account) const = 0;

    /// kInsufficientBalance if from holds less than amount
    virtual outcome::result<void> transfer(storage::BufferMap &state,
                                           const AssetId &asset,
                                           const AccountId &from,
                                           const AccountId &to,
                                           TokenAmount amount) = 0;

    virtual outcome::result<void> mint(storage::BufferMap &state,
                                       const AssetId &asset,
                                       const AccountId &to,
                                       TokenAmount amount) = 0;
  };
}  // namespace fr::router

OUTCOME_HPP_DECLARE_ERROR(fr::router, TokenLedgerError);
