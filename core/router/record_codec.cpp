/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/record_codec.hpp"

#include "common/le_encoder.hpp"

namespace fr::router::codec {
  using common::encodeInteger;
  using common::encodeString;
  using common::LeDecoder;

  namespace {
    /// Unwraps decoder result or returns kTruncated
    template <typename T>
    outcome::result<T> need(boost::optional<T> value) {
      if (!value) {
        return RecordCodecError::kTruncated;
      }
      return std::move(*value);
    }

    outcome::result<bool> needBool(LeDecoder &decoder) {
      OUTCOME_TRY(flag, need(decoder.integer<uint8_t>()));
      if (flag > 1) {
        return RecordCodecError::kInvalidValue;
      }
      return flag == 1;
    }

    outcome::result<LeDecoder> openRecord(const Bytes &bytes) {
      LeDecoder decoder{bytes};
      OUTCOME_TRY(version, need(decoder.integer<uint8_t>()));
      if (version != kRecordVersion) {
        return RecordCodecError::kUnsupportedVersion;
      }
      return decoder;
    }

    outcome::result<void> closeRecord(const LeDecoder &decoder) {
      if (!decoder.empty()) {
        return RecordCodecError::kTrailingBytes;
      }
      return outcome::success();
    }
  }  // namespace

  Bytes encode(const Policy &policy) {
    Bytes out;
    encodeInteger(kRecordVersion, out);
    encodeString(policy.vault, out);
    encodeString(policy.creator_wallet, out);
    encodeInteger(policy.investor_fee_share_bps, out);
    encodeInteger(static_cast<uint8_t>(policy.daily_cap.has_value()), out);
    encodeInteger(policy.daily_cap.value_or(0), out);
    encodeInteger(policy.min_payout, out);
    encodeInteger(policy.y0_total_allocation, out);
    encodeInteger(policy.total_investors, out);
    return out;
  }

  template <>
  outcome::result<Policy> decode<Policy>(const Bytes &bytes) {
    OUTCOME_TRY(decoder, openRecord(bytes));
    Policy policy;
    OUTCOME_TRYA(policy.vault, need(decoder.string()));
    OUTCOME_TRYA(policy.creator_wallet, need(decoder.string()));
    OUTCOME_TRYA(policy.investor_fee_share_bps,
                 need(decoder.integer<BasisPoints>()));
    OUTCOME_TRY(has_cap, needBool(decoder));
    OUTCOME_TRY(cap, need(decoder.integer<TokenAmount>()));
    if (has_cap) {
      policy.daily_cap = cap;
    }
    OUTCOME_TRYA(policy.min_payout, need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(policy.y0_total_allocation,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(policy.total_investors, need(decoder.integer<uint32_t>()));
    OUTCOME_TRY(closeRecord(decoder));
    return policy;
  }

  Bytes encode(const DistributionProgress &progress) {
    Bytes out;
    encodeInteger(kRecordVersion, out);
    encodeString(progress.vault, out);
    encodeInteger(progress.last_distribution_ts.count(), out);
    encodeInteger(progress.cursor, out);
    append(out, progress.paid.toBytes());
    encodeInteger(progress.current_day_total_claimed, out);
    encodeInteger(progress.current_day_distributed, out);
    encodeInteger(static_cast<uint8_t>(progress.day_completed), out);
    encodeInteger(progress.current_day_start_ts.count(), out);
    encodeInteger(progress.current_day_total_locked, out);
    encodeInteger(progress.current_day_eligible_bps, out);
    encodeInteger(progress.current_day_investor_pool, out);
    encodeInteger(progress.total_distributions, out);
    encodeInteger(progress.total_investor_distributed, out);
    encodeInteger(progress.total_creator_distributed, out);
    return out;
  }

  template <>
  outcome::result<DistributionProgress> decode<DistributionProgress>(
      const Bytes &bytes) {
    OUTCOME_TRY(decoder, openRecord(bytes));
    DistributionProgress progress;
    OUTCOME_TRYA(progress.vault, need(decoder.string()));
    OUTCOME_TRY(last_ts, need(decoder.integer<int64_t>()));
    progress.last_distribution_ts = UnixTime{last_ts};
    OUTCOME_TRYA(progress.cursor, need(decoder.integer<InvestorIndex>()));
    OUTCOME_TRY(bitmap_bytes, need(decoder.bytes(PaidBitmap::kByteSize)));
    OUTCOME_TRYA(progress.paid, need(PaidBitmap::fromBytes(bitmap_bytes)));
    OUTCOME_TRYA(progress.current_day_total_claimed,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(progress.current_day_distributed,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(progress.day_completed, needBool(decoder));
    OUTCOME_TRY(start_ts, need(decoder.integer<int64_t>()));
    progress.current_day_start_ts = UnixTime{start_ts};
    OUTCOME_TRYA(progress.current_day_total_locked,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(progress.current_day_eligible_bps,
                 need(decoder.integer<BasisPoints>()));
    OUTCOME_TRYA(progress.current_day_investor_pool,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(progress.total_distributions,
                 need(decoder.integer<uint64_t>()));
    OUTCOME_TRYA(progress.total_investor_distributed,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRYA(progress.total_creator_distributed,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRY(closeRecord(decoder));
    return progress;
  }

  Bytes encode(const HonoraryPosition &position) {
    Bytes out;
    encodeInteger(kRecordVersion, out);
    encodeString(position.vault, out);
    encodeString(position.pool, out);
    encodeString(position.quote_asset, out);
    encodeString(position.base_asset, out);
    encodeString(position.position, out);
    encodeString(position.owner, out);
    encodeInteger(position.total_fees_claimed, out);
    return out;
  }

  template <>
  outcome::result<HonoraryPosition> decode<HonoraryPosition>(
      const Bytes &bytes) {
    OUTCOME_TRY(decoder, openRecord(bytes));
    HonoraryPosition position;
    OUTCOME_TRYA(position.vault, need(decoder.string()));
    OUTCOME_TRYA(position.pool, need(decoder.string()));
    OUTCOME_TRYA(position.quote_asset, need(decoder.string()));
    OUTCOME_TRYA(position.base_asset, need(decoder.string()));
    OUTCOME_TRYA(position.position, need(decoder.string()));
    OUTCOME_TRYA(position.owner, need(decoder.string()));
    OUTCOME_TRYA(position.total_fees_claimed,
                 need(decoder.integer<TokenAmount>()));
    OUTCOME_TRY(closeRecord(decoder));
    return position;
  }
}  // namespace fr::router::codec

OUTCOME_CPP_DEFINE_CATEGORY(fr::router::codec, RecordCodecError, e) {
  using fr::router::codec::RecordCodecError;
  switch (e) {
    case RecordCodecError::kUnsupportedVersion:
      return "RecordCodecError: unsupported record version";
    case RecordCodecError::kTruncated:
      return "RecordCodecError: record is truncated";
    case RecordCodecError::kTrailingBytes:
      return "RecordCodecError: unexpected bytes after record";
    case RecordCodecError::kInvalidValue:
      return "RecordCodecError: invalid field value";
  }
  return "RecordCodecError: unknown error";
}
