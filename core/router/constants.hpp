/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <cstdint>

#include "router/types.hpp"

namespace fr::router {
  constexpr BasisPoints kBasisPointsDivisor{10000};

  /// Upper bound of investors touched by one crank page
  constexpr uint32_t kMaxPageSize{50};

  /// Capacity of the paid-investor bitmap
  constexpr size_t kMaxInvestors{2048};

  /// Minimal spacing between two distribution days
  constexpr UnixTime kDistributionWindow{clock::kDay};
}  // namespace fr::router
