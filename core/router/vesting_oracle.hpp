/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"
#include "router/types.hpp"

namespace fr::router {
  /**
   * Read-only view of the vesting system
   */
  class VestingOracle {
   public:
    virtual ~VestingOracle() = default;

    /**
     * Amount of the stream allocation still vesting at time
     * @return kInsufficientVestingData if the stream can not be read
     */
    virtual outcome::result<TokenAmount> locked(const StreamId &stream,
                                                UnixTime time) const = 0;
  };
}  // namespace fr::router
