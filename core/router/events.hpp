/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/signals2.hpp>

#include "router/position.hpp"

namespace fr::router::events {
  using Connection = boost::signals2::scoped_connection;

  struct PolicySetup {
    VaultId vault;
    AccountId creator_wallet;
    BasisPoints investor_fee_share_bps{};
    boost::optional<TokenAmount> daily_cap;
    TokenAmount min_payout{};
    TokenAmount y0_total_allocation{};
    uint32_t total_investors{};
  };

  struct HonoraryPositionInitialized {
    VaultId vault;
    PoolId pool;
    PositionId position;
    AccountId owner;
    AssetId quote_asset;
  };

  struct QuoteFeesClaimed {
    VaultId vault;
    PositionId position;
    TokenAmount amount{};
    UnixTime timestamp{};
  };

  struct InvestorPayoutPage {
    VaultId vault;
    InvestorIndex page_start{};
    uint32_t investors{};
    uint32_t investors_paid{};
    TokenAmount total_paid{};
    TokenAmount dust{};
    UnixTime timestamp{};
  };

  struct CreatorPayoutDayClosed {
    VaultId vault;
    AccountId creator_wallet;
    TokenAmount creator_amount{};
    TokenAmount investors_distributed{};
    TokenAmount total_claimed{};
    UnixTime timestamp{};
  };

  /**
   * Notifications about committed router transitions. Delivered synchronously
   * on the thread which committed the transition, after the vault lock is
   * released, so a handler may call the router again.
   */
  struct Events {
#define DEFINE_EVENT(STRUCT)                                         \
  using STRUCT##Callback = void(const STRUCT &);                     \
  Connection subscribe##STRUCT(std::function<STRUCT##Callback> cb) { \
    return STRUCT##_signal_.connect(cb);                             \
  }                                                                  \
  void signal##STRUCT(const STRUCT &event) {                         \
    STRUCT##_signal_(event);                                         \
  }                                                                  \
  boost::signals2::signal<STRUCT##Callback> STRUCT##_signal_

    DEFINE_EVENT(PolicySetup);
    DEFINE_EVENT(HonoraryPositionInitialized);
    DEFINE_EVENT(QuoteFeesClaimed);
    DEFINE_EVENT(InvestorPayoutPage);
    DEFINE_EVENT(CreatorPayoutDayClosed);

#undef DEFINE_EVENT
  };
}  // namespace fr::router::events
