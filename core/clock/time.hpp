/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/outcome.hpp"

namespace fr::clock {
  enum class TimeFromStringError { kInvalidFormat = 1 };

  /// Seconds since unix epoch, the resolution of distribution windows
  using UnixTime = std::chrono::seconds;
  using std::chrono::microseconds;

  /// Length of one distribution cycle
  constexpr UnixTime kDay{86400};

  /// "YYYY-MM-DDTHH:MM:SSZ"
  std::string unixTimeToString(UnixTime);

  /**
   * Parses "YYYY-MM-DDTHH:MM:SSZ", or "YYYY-MM-DD" for midnight of that day
   */
  outcome::result<UnixTime> unixTimeFromString(const std::string &str);
}  // namespace fr::clock

OUTCOME_HPP_DECLARE_ERROR(fr::clock, TimeFromStringError);
