/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/impl/fee_router_impl.hpp"

#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "router/addresses.hpp"
#include "router/distribution_engine.hpp"
#include "router/fee_math.hpp"
#include "router/position_guard.hpp"
#include "router/router_error.hpp"
#include "router/vault_store.hpp"

namespace fr::router {
  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("fee_router");
      return logger.get();
    }
  }  // namespace

  FeeRouterImpl::FeeRouterImpl(
      std::shared_ptr<storage::PersistentBufferMap> store,
      std::shared_ptr<FeeSource> fee_source,
      std::shared_ptr<VestingOracle> vesting,
      std::shared_ptr<TokenLedger> ledger,
      std::shared_ptr<clock::UTCClock> clock,
      std::shared_ptr<events::Events> events)
      : store_{std::move(store)},
        fee_source_{std::move(fee_source)},
        vesting_{std::move(vesting)},
        ledger_{std::move(ledger)},
        clock_{std::move(clock)},
        events_{std::move(events)} {}

  std::shared_ptr<std::mutex> FeeRouterImpl::vaultMutex(const VaultId &vault) {
    std::lock_guard lock{vaults_mutex_};
    auto &mutex{vault_mutexes_[vault]};
    if (!mutex) {
      mutex = std::make_shared<std::mutex>();
    }
    return mutex;
  }

  outcome::result<void> FeeRouterImpl::setupPolicy(const Policy &policy) {
    auto result{commitPolicy(policy)};
    if (!result) {
      log()->warn("setup of vault {} rejected: {:#}",
                  policy.vault,
                  result.error());
      return result;
    }

    log()->info(
        "policy of vault {} set up: share {} bps, y0 {}, {} investors",
        policy.vault,
        policy.investor_fee_share_bps,
        policy.y0_total_allocation,
        policy.total_investors);
    events_->signalPolicySetup({
        policy.vault,
        policy.creator_wallet,
        policy.investor_fee_share_bps,
        policy.daily_cap,
        policy.min_payout,
        policy.y0_total_allocation,
        policy.total_investors,
    });
    return outcome::success();
  }

  outcome::result<void> FeeRouterImpl::commitPolicy(const Policy &policy) {
    OUTCOME_TRY(validatePolicy(policy));
    const auto mutex{vaultMutex(policy.vault)};
    std::lock_guard lock{*mutex};
    auto batch{store_->batch()};
    VaultStore records{*batch};
    if (records.hasPolicy(policy.vault)) {
      return RouterError::kPolicyAlreadyExists;
    }
    OUTCOME_TRY(records.putPolicy(policy));
    OUTCOME_TRY(records.putProgress(initialProgress(policy.vault)));
    return batch->commit();
  }

  outcome::result<HonoraryPosition> FeeRouterImpl::initializePosition(
      const VaultId &vault, const PoolId &pool, const AssetId &quote_asset) {
    auto result{commitPosition(vault, pool, quote_asset)};
    if (!result) {
      log()->warn("honorary position of vault {} in pool {} rejected: {:#}",
                  vault,
                  pool,
                  result.error());
      return result;
    }

    const auto &position{result.value()};
    log()->info("honorary position {} of vault {} opened in pool {}",
                position.position,
                vault,
                pool);
    events_->signalHonoraryPositionInitialized({
        vault,
        pool,
        position.position,
        position.owner,
        quote_asset,
    });
    return result;
  }

  outcome::result<HonoraryPosition> FeeRouterImpl::commitPosition(
      const VaultId &vault, const PoolId &pool, const AssetId &quote_asset) {
    const auto mutex{vaultMutex(vault)};
    std::lock_guard lock{*mutex};
    auto batch{store_->batch()};
    VaultStore records{*batch};
    if (records.hasPosition(vault)) {
      return RouterError::kPositionAlreadyExists;
    }
    OUTCOME_TRY(config, fee_source_->poolConfig(*batch, pool));
    OUTCOME_TRY(base_asset, checkQuoteOnlyPool(config, quote_asset));

    HonoraryPosition position;
    position.vault = vault;
    position.pool = pool;
    position.quote_asset = quote_asset;
    position.base_asset = base_asset;
    position.owner = positionOwnerAccount(vault);
    OUTCOME_TRYA(position.position,
                 fee_source_->openPosition(*batch, pool, position.owner));
    OUTCOME_TRY(records.putPosition(position));
    OUTCOME_TRY(batch->commit());
    return position;
  }

  outcome::result<PageReport> FeeRouterImpl::runPage(
      const VaultId &vault,
      InvestorIndex page_start,
      uint32_t page_size,
      const std::vector<InvestorAccount> &investors) {
    auto committed{commitPage(vault, page_start, page_size, investors)};
    if (!committed) {
      log()->warn("page {}+{} of vault {} rejected: {:#}",
                  page_start,
                  page_size,
                  vault,
                  committed.error());
      return committed.error();
    }

    // the vault lock is released here, handlers may crank again
    const auto &page{committed.value()};
    const auto &report{page.report};
    const auto &result{page.result};
    if (result.day_split) {
      log()->info(
          "vault {} day started: claimed {}, locked {}, eligible {} bps, "
          "investor pool {}",
          vault,
          *report.claimed,
          result.day_split->total_locked,
          result.day_split->eligible_bps,
          result.day_split->investor_pool);
      events_->signalQuoteFeesClaimed(
          {vault, page.position, *report.claimed, page.now});
    }
    log()->info("vault {} page {}+{} paid {} to {} investors, dust {}",
                vault,
                page_start,
                report.investors,
                report.paid,
                report.investors_paid,
                report.dust);
    events_->signalInvestorPayoutPage({
        vault,
        page_start,
        report.investors,
        report.investors_paid,
        report.paid,
        report.dust,
        page.now,
    });
    if (result.creator_payout) {
      log()->info("vault {} day closed: creator {}, investors {}",
                  vault,
                  *result.creator_payout,
                  result.next.current_day_distributed);
      events_->signalCreatorPayoutDayClosed({
          vault,
          page.creator_wallet,
          *result.creator_payout,
          result.next.current_day_distributed,
          result.next.current_day_total_claimed,
          page.now,
      });
    }
    return report;
  }

  outcome::result<TokenAmount> FeeRouterImpl::claimFees(
      storage::BufferMap &state,
      VaultStore &records,
      HonoraryPosition &position) {
    const auto expected_owner{positionOwnerAccount(position.vault)};
    OUTCOME_TRY(checkPositionOwnership(expected_owner, position.owner));
    OUTCOME_TRY(owner, fee_source_->positionOwner(state, position.position));
    OUTCOME_TRY(checkPositionOwnership(expected_owner, owner));

    OUTCOME_TRY(claimed,
                fee_source_->claim(
                    state, position, treasuryAccount(position.vault)));
    OUTCOME_TRY(checkClaim(claimed));
    OUTCOME_TRYA(position.total_fees_claimed,
                 math::checkedAdd(position.total_fees_claimed, claimed.quote));
    OUTCOME_TRY(records.putPosition(position));
    return claimed.quote;
  }

  outcome::result<std::vector<TokenAmount>> FeeRouterImpl::lockedAmounts(
      const std::vector<InvestorAccount> &investors, UnixTime time) const {
    std::vector<TokenAmount> locked;
    locked.reserve(investors.size());
    for (const auto &investor : investors) {
      OUTCOME_TRY(amount, vesting_->locked(investor.stream, time));
      locked.push_back(amount);
    }
    return locked;
  }

  outcome::result<FeeRouterImpl::CommittedPage> FeeRouterImpl::commitPage(
      const VaultId &vault,
      InvestorIndex page_start,
      uint32_t page_size,
      const std::vector<InvestorAccount> &investors) {
    const auto mutex{vaultMutex(vault)};
    std::lock_guard lock{*mutex};
    auto batch{store_->batch()};
    VaultStore records{*batch};
    OUTCOME_TRY(policy, records.policy(vault));
    OUTCOME_TRY(progress, records.progress(vault));
    OUTCOME_TRY(position, records.position(vault));
    const auto now{clock_->nowUTC()};

    OUTCOME_TRY(admitPage(
        policy, progress, page_start, page_size, investors.size(), now));
    const auto day_start{progress.cursor == 0};

    PageInput input;
    input.page_start = page_start;
    input.page_size = page_size;
    input.now = now;
    if (day_start) {
      OUTCOME_TRYA(input.claimed, claimFees(*batch, records, position));
      OUTCOME_TRYA(input.locked, lockedAmounts(investors, now));
    } else {
      OUTCOME_TRYA(input.locked,
                   lockedAmounts(investors, progress.current_day_start_ts));
    }
    OUTCOME_TRY(result, router::runPage(policy, progress, input));

    const auto treasury{treasuryAccount(vault)};
    for (const auto &payout : result.payouts) {
      const auto &investor{investors.at(
          day_start ? payout.index : payout.index - page_start)};
      log()->debug("vault {} investor {} paid {}",
                   vault,
                   payout.index,
                   payout.amount);
      OUTCOME_TRY(ledger_->transfer(*batch,
                                    position.quote_asset,
                                    treasury,
                                    investor.wallet,
                                    payout.amount));
    }
    for (const auto &index : result.dust) {
      log()->debug("vault {} investor {} payout below minimum {}",
                   vault,
                   index,
                   policy.min_payout);
    }
    if (result.creator_payout && *result.creator_payout != 0) {
      OUTCOME_TRY(ledger_->transfer(*batch,
                                    position.quote_asset,
                                    treasury,
                                    policy.creator_wallet,
                                    *result.creator_payout));
    }
    OUTCOME_TRY(records.putProgress(result.next));
    OUTCOME_TRY(batch->commit());

    CommittedPage page;
    auto &report{page.report};
    report.vault = vault;
    report.page_start = page_start;
    report.investors = pageLength(policy, page_start, page_size);
    report.investors_paid = static_cast<uint32_t>(result.payouts.size());
    report.paid = result.paid;
    report.dust = result.dust_amount;
    report.creator_payout = result.creator_payout;
    report.cursor = result.next.cursor;
    report.day_completed = result.next.day_completed;
    if (result.day_split) {
      report.claimed = input.claimed;
    }
    page.position = position.position;
    page.creator_wallet = policy.creator_wallet;
    page.now = now;
    page.result = std::move(result);
    return page;
  }

  outcome::result<Policy> FeeRouterImpl::getPolicy(const VaultId &vault) const {
    return VaultStore{*store_}.policy(vault);
  }

  outcome::result<DistributionProgress> FeeRouterImpl::getProgress(
      const VaultId &vault) const {
    return VaultStore{*store_}.progress(vault);
  }

  outcome::result<HonoraryPosition> FeeRouterImpl::getPosition(
      const VaultId &vault) const {
    return VaultStore{*store_}.position(vault);
  }
}  // namespace fr::router
