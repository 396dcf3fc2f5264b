/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "router/token_ledger.hpp"

namespace fr::router {
  /**
   * Ledger keeping balances in the key-value state, one entry per asset and
   * account. Missing entries are zero balances.
   */
  class BufferTokenLedger : public TokenLedger {
   public:
    outcome::result<TokenAmount> balance(
        const storage::BufferMap &state,
        const AssetId &asset,
        const AccountId &account) const override;

    outcome::result<void> transfer(storage::BufferMap &state,
                                   const AssetId &asset,
                                   const AccountId &from,
                                   const AccountId &to,
                                   TokenAmount amount) override;

    outcome::result<void> mint(storage::BufferMap &state,
                               const AssetId &asset,
                               const AccountId &to,
                               TokenAmount amount) override;
  };
}  // namespace fr::router
