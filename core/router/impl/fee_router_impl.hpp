/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>

#include "clock/utc_clock.hpp"
#include "router/distribution_engine.hpp"
#include "router/events.hpp"
#include "router/fee_router.hpp"
#include "router/fee_source.hpp"
#include "router/token_ledger.hpp"
#include "router/vesting_oracle.hpp"
#include "storage/buffer_map.hpp"

namespace fr::router {
  class VaultStore;

  /**
   * Router running every call in one storage batch. Calls on the same vault
   * are serialized, distinct vaults proceed independently.
   */
  class FeeRouterImpl : public FeeRouter {
   public:
    FeeRouterImpl(std::shared_ptr<storage::PersistentBufferMap> store,
                  std::shared_ptr<FeeSource> fee_source,
                  std::shared_ptr<VestingOracle> vesting,
                  std::shared_ptr<TokenLedger> ledger,
                  std::shared_ptr<clock::UTCClock> clock,
                  std::shared_ptr<events::Events> events);

    outcome::result<void> setupPolicy(const Policy &policy) override;

    outcome::result<HonoraryPosition> initializePosition(
        const VaultId &vault,
        const PoolId &pool,
        const AssetId &quote_asset) override;

    outcome::result<PageReport> runPage(
        const VaultId &vault,
        InvestorIndex page_start,
        uint32_t page_size,
        const std::vector<InvestorAccount> &investors) override;

    outcome::result<Policy> getPolicy(const VaultId &vault) const override;

    outcome::result<DistributionProgress> getProgress(
        const VaultId &vault) const override;

    outcome::result<HonoraryPosition> getPosition(
        const VaultId &vault) const override;

   private:
    /// Page committed under the vault lock, published after its release
    struct CommittedPage {
      PageReport report;
      PageResult result;
      PositionId position;
      AccountId creator_wallet;
      UnixTime now{};
    };

    std::shared_ptr<std::mutex> vaultMutex(const VaultId &vault);

    outcome::result<void> commitPolicy(const Policy &policy);

    outcome::result<HonoraryPosition> commitPosition(
        const VaultId &vault, const PoolId &pool, const AssetId &quote_asset);

    outcome::result<CommittedPage> commitPage(
        const VaultId &vault,
        InvestorIndex page_start,
        uint32_t page_size,
        const std::vector<InvestorAccount> &investors);

    /// Claims fees of the day into the vault treasury
    outcome::result<TokenAmount> claimFees(storage::BufferMap &state,
                                           VaultStore &records,
                                           HonoraryPosition &position);

    outcome::result<std::vector<TokenAmount>> lockedAmounts(
        const std::vector<InvestorAccount> &investors, UnixTime time) const;

    std::shared_ptr<storage::PersistentBufferMap> store_;
    std::shared_ptr<FeeSource> fee_source_;
    std::shared_ptr<VestingOracle> vesting_;
    std::shared_ptr<TokenLedger> ledger_;
    std::shared_ptr<clock::UTCClock> clock_;
    std::shared_ptr<events::Events> events_;

    std::mutex vaults_mutex_;
    std::map<VaultId, std::shared_ptr<std::mutex>> vault_mutexes_;
  };
}  // namespace fr::router
