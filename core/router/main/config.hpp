/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "router/types.hpp"

namespace fr::router::sim {
  /**
   * Investor with a linear vesting stream, parsed from
   * "wallet:deposited:start_day:end_day", days relative to the start time
   */
  struct InvestorConfig {
    AccountId wallet;
    TokenAmount deposited{};
    int64_t start_day{};
    int64_t end_day{};
  };

  struct Config {
    spdlog::level::level_enum log_level{spdlog::level::info};

    VaultId vault;
    AccountId creator_wallet;
    PoolId pool;
    AssetId token_a;
    AssetId token_b;
    int collect_fee_mode{};
    AssetId quote_asset;

    BasisPoints investor_fee_share_bps{};
    boost::optional<TokenAmount> daily_cap;
    TokenAmount min_payout{};
    /// defaults to the sum of investor deposits
    boost::optional<TokenAmount> y0_total_allocation;
    std::vector<InvestorConfig> investors;

    TokenAmount quote_fees_per_day{};
    TokenAmount base_fees_per_day{};
    uint32_t page_size{};
    uint32_t days{};
    UnixTime start_time{};

    static Config read(int argc, char *argv[]);

    outcome::result<TokenAmount> totalAllocation() const;
  };

  spdlog::level::level_enum getLogLevel(char level);
}  // namespace fr::router::sim
