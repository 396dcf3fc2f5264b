/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "common/outcome.hpp"
#include "router/policy.hpp"
#include "router/position.hpp"
#include "router/progress.hpp"

namespace fr::router::codec {
  enum class RecordCodecError {
    kUnsupportedVersion = 1,
    kTruncated,
    kTrailingBytes,
    kInvalidValue,
  };

  /// Layout version written as the first byte of every record
  constexpr uint8_t kRecordVersion{1};

  Bytes encode(const Policy &policy);
  Bytes encode(const DistributionProgress &progress);
  Bytes encode(const HonoraryPosition &position);

  /**
   * Decodes record of type T, one of Policy, DistributionProgress,
   * HonoraryPosition
   */
  template <typename T>
  outcome::result<T> decode(const Bytes &bytes);

  template <>
  outcome::result<Policy> decode<Policy>(const Bytes &bytes);
  template <>
  outcome::result<DistributionProgress> decode<DistributionProgress>(
      const Bytes &bytes);
  template <>
  outcome::result<HonoraryPosition> decode<HonoraryPosition>(
      const Bytes &bytes);
}  // namespace fr::router::codec

OUTCOME_HPP_DECLARE_ERROR(fr::router::codec, RecordCodecError);
