/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/impl/buffer_token_ledger.hpp"

#include <limits>

#include "common/le_encoder.hpp"

namespace fr::router {
  namespace {
    Bytes balanceKey(const AssetId &asset, const AccountId &account) {
      return bytesOf("balance/" + asset + "/" + account);
    }

    outcome::result<void> putBalance(storage::BufferMap &state,
                                     const AssetId &asset,
                                     const AccountId &account,
                                     TokenAmount amount) {
      const auto key{balanceKey(asset, account)};
      if (amount == 0) {
        return state.remove(key);
      }
      Bytes value;
      common::encodeInteger(amount, value);
      return state.put(key, std::move(value));
    }
  }  // namespace

  outcome::result<TokenAmount> BufferTokenLedger::balance(
      const storage::BufferMap &state,
      const AssetId &asset,
      const AccountId &account) const {
    const auto key{balanceKey(asset, account)};
    if (!state.contains(key)) {
      return TokenAmount{0};
    }
    OUTCOME_TRY(value, state.get(key));
    common::LeDecoder decoder{value};
    const auto amount{decoder.integer<TokenAmount>()};
    if (!amount || !decoder.empty()) {
      return TokenLedgerError::kInvalidBalance;
    }
    return *amount;
  }

  outcome::result<void> BufferTokenLedger::transfer(storage::BufferMap &state,
                                                    const AssetId &asset,
                                                    const AccountId &from,
                                                    const AccountId &to,
                                                    TokenAmount amount) {
    if (from == to) {
      return outcome::success();
    }
    OUTCOME_TRY(from_balance, balance(state, asset, from));
    if (from_balance < amount) {
      return TokenLedgerError::kInsufficientBalance;
    }
    OUTCOME_TRY(to_balance, balance(state, asset, to));
    if (to_balance > std::numeric_limits<TokenAmount>::max() - amount) {
      return TokenLedgerError::kBalanceOverflow;
    }
    OUTCOME_TRY(putBalance(state, asset, from, from_balance - amount));
    return putBalance(state, asset, to, to_balance + amount);
  }

  outcome::result<void> BufferTokenLedger::mint(storage::BufferMap &state,
                                                const AssetId &asset,
                                                const AccountId &to,
                                                TokenAmount amount) {
    OUTCOME_TRY(to_balance, balance(state, asset, to));
    if (to_balance > std::numeric_limits<TokenAmount>::max() - amount) {
      return TokenLedgerError::kBalanceOverflow;
    }
    return putBalance(state, asset, to, to_balance + amount);
  }
}  // namespace fr::router

OUTCOME_CPP_DEFINE_CATEGORY(fr::router, TokenLedgerError, e) {
  using fr::router::TokenLedgerError;
  switch (e) {
    case TokenLedgerError::kInsufficientBalance:
      return "TokenLedgerError: insufficient balance";
    case TokenLedgerError::kBalanceOverflow:
      return "TokenLedgerError: balance overflow";
    case TokenLedgerError::kInvalidBalance:
      return "TokenLedgerError: malformed balance entry";
  }
  return "TokenLedgerError: unknown error";
}
