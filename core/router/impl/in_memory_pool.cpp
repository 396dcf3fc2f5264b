/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/impl/in_memory_pool.hpp"

#include "common/le_encoder.hpp"
#include "common/logger.hpp"
#include "router/fee_math.hpp"

namespace fr::router {
  using common::encodeInteger;
  using common::encodeString;
  using common::LeDecoder;

  namespace {
    auto log() {
      static common::Logger logger = common::createLogger("pool");
      return logger.get();
    }

    Bytes poolKey(const PoolId &pool) {
      return bytesOf("amm/pool/" + pool);
    }

    Bytes positionCounterKey(const PoolId &pool) {
      return bytesOf("amm/pool/" + pool + "/positions");
    }

    Bytes positionKey(const PositionId &position) {
      return bytesOf("amm/position/" + position);
    }
  }  // namespace

  InMemoryPool::InMemoryPool(std::shared_ptr<TokenLedger> ledger)
      : ledger_{std::move(ledger)} {}

  AccountId InMemoryPool::feeVault(const PositionId &position) {
    return "amm/" + position + "/fee_vault";
  }

  outcome::result<void> InMemoryPool::createPool(storage::BufferMap &state,
                                                 const PoolConfig &config) {
    const auto key{poolKey(config.pool)};
    if (state.contains(key)) {
      return PoolError::kPoolAlreadyExists;
    }
    Bytes value;
    encodeString(config.token_a, value);
    encodeString(config.token_b, value);
    encodeInteger(static_cast<uint8_t>(config.collect_fee_mode), value);
    encodeInteger(static_cast<uint8_t>(config.status), value);
    OUTCOME_TRY(state.put(key, std::move(value)));
    log()->debug("pool {} created: {}/{} mode {}",
                 config.pool,
                 config.token_a,
                 config.token_b,
                 static_cast<int>(config.collect_fee_mode));
    return outcome::success();
  }

  outcome::result<PoolConfig> InMemoryPool::poolConfig(
      const storage::BufferMap &state, const PoolId &pool) const {
    const auto key{poolKey(pool)};
    if (!state.contains(key)) {
      return PoolError::kPoolNotFound;
    }
    OUTCOME_TRY(value, state.get(key));
    LeDecoder decoder{value};
    auto token_a{decoder.string()};
    auto token_b{decoder.string()};
    const auto mode{decoder.integer<uint8_t>()};
    const auto status{decoder.integer<uint8_t>()};
    if (!token_a || !token_b || !mode || !status || !decoder.empty()) {
      return PoolError::kInvalidRecord;
    }
    PoolConfig config;
    config.pool = pool;
    config.token_a = std::move(*token_a);
    config.token_b = std::move(*token_b);
    config.collect_fee_mode = CollectFeeMode{*mode};
    config.status = PoolStatus{*status};
    return config;
  }

  outcome::result<InMemoryPool::PositionRecord> InMemoryPool::loadPosition(
      const storage::BufferMap &state, const PositionId &position) const {
    const auto key{positionKey(position)};
    if (!state.contains(key)) {
      return PoolError::kPositionNotFound;
    }
    OUTCOME_TRY(value, state.get(key));
    LeDecoder decoder{value};
    auto pool{decoder.string()};
    auto owner{decoder.string()};
    const auto accrued_a{decoder.integer<TokenAmount>()};
    const auto accrued_b{decoder.integer<TokenAmount>()};
    if (!pool || !owner || !accrued_a || !accrued_b || !decoder.empty()) {
      return PoolError::kInvalidRecord;
    }
    return PositionRecord{
        std::move(*pool), std::move(*owner), *accrued_a, *accrued_b};
  }

  outcome::result<void> InMemoryPool::savePosition(
      storage::BufferMap &state,
      const PositionId &position,
      const PositionRecord &record) {
    Bytes value;
    encodeString(record.pool, value);
    encodeString(record.owner, value);
    encodeInteger(record.accrued_a, value);
    encodeInteger(record.accrued_b, value);
    return state.put(positionKey(position), std::move(value));
  }

  outcome::result<PositionId> InMemoryPool::openPosition(
      storage::BufferMap &state, const PoolId &pool, const AccountId &owner) {
    if (!state.contains(poolKey(pool))) {
      return PoolError::kPoolNotFound;
    }
    const auto counter_key{positionCounterKey(pool)};
    uint64_t next{0};
    if (state.contains(counter_key)) {
      OUTCOME_TRY(value, state.get(counter_key));
      const auto counter{LeDecoder{value}.integer<uint64_t>()};
      if (!counter) {
        return PoolError::kInvalidRecord;
      }
      next = *counter;
    }
    Bytes counter_value;
    encodeInteger(next + 1, counter_value);
    OUTCOME_TRY(state.put(counter_key, std::move(counter_value)));

    PositionId position{pool + "/position/" + std::to_string(next)};
    OUTCOME_TRY(savePosition(state, position, {pool, owner, 0, 0}));
    log()->debug("position {} opened for {}", position, owner);
    return position;
  }

  outcome::result<AccountId> InMemoryPool::positionOwner(
      const storage::BufferMap &state, const PositionId &position) const {
    OUTCOME_TRY(record, loadPosition(state, position));
    return record.owner;
  }

  outcome::result<void> InMemoryPool::accrueFees(storage::BufferMap &state,
                                                 const PositionId &position,
                                                 TokenAmount amount_a,
                                                 TokenAmount amount_b) {
    OUTCOME_TRY(record, loadPosition(state, position));
    OUTCOME_TRY(config, poolConfig(state, record.pool));
    OUTCOME_TRYA(record.accrued_a, math::checkedAdd(record.accrued_a, amount_a));
    OUTCOME_TRYA(record.accrued_b, math::checkedAdd(record.accrued_b, amount_b));
    const auto vault{feeVault(position)};
    OUTCOME_TRY(ledger_->mint(state, config.token_a, vault, amount_a));
    OUTCOME_TRY(ledger_->mint(state, config.token_b, vault, amount_b));
    return savePosition(state, position, record);
  }

  outcome::result<ClaimedFees> InMemoryPool::claim(
      storage::BufferMap &state,
      const HonoraryPosition &position,
      const AccountId &recipient) {
    OUTCOME_TRY(record, loadPosition(state, position.position));
    if (record.pool != position.pool) {
      return PoolError::kPositionPoolMismatch;
    }
    OUTCOME_TRY(config, poolConfig(state, record.pool));
    const auto vault{feeVault(position.position)};
    OUTCOME_TRY(ledger_->transfer(
        state, config.token_a, vault, recipient, record.accrued_a));
    OUTCOME_TRY(ledger_->transfer(
        state, config.token_b, vault, recipient, record.accrued_b));

    ClaimedFees claimed;
    if (position.quote_asset == config.token_a) {
      claimed = {record.accrued_a, record.accrued_b};
    } else {
      claimed = {record.accrued_b, record.accrued_a};
    }
    log()->debug("position {} claimed {} quote, {} base",
                 position.position,
                 claimed.quote,
                 claimed.base);
    record.accrued_a = 0;
    record.accrued_b = 0;
    OUTCOME_TRY(savePosition(state, position.position, record));
    return claimed;
  }
}  // namespace fr::router

OUTCOME_CPP_DEFINE_CATEGORY(fr::router, PoolError, e) {
  using fr::router::PoolError;
  switch (e) {
    case PoolError::kPoolNotFound:
      return "PoolError: pool not found";
    case PoolError::kPoolAlreadyExists:
      return "PoolError: pool already exists";
    case PoolError::kPositionNotFound:
      return "PoolError: position not found";
    case PoolError::kPositionPoolMismatch:
      return "PoolError: position belongs to another pool";
    case PoolError::kInvalidRecord:
      return "PoolError: malformed pool record";
  }
  return "PoolError: unknown error";
}
