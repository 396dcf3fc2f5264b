/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <shared_mutex>

#include "router/vesting_oracle.hpp"

namespace fr::router {
  /**
   * Stream releasing cliff_amount at cliff and the rest linearly until end
   */
  struct LinearStream {
    TokenAmount deposited{};
    UnixTime start{};
    UnixTime cliff{};
    TokenAmount cliff_amount{};
    UnixTime end{};

    /// Amount released at time, within [0, deposited]
    TokenAmount unlocked(UnixTime time) const;
  };

  /**
   * Oracle over linear vesting streams, locked = deposited - unlocked
   */
  class LinearVestingOracle : public VestingOracle {
   public:
    /**
     * Registers or replaces a stream
     * @return kInsufficientVestingData if the schedule is inconsistent
     */
    outcome::result<void> addStream(const StreamId &id, LinearStream stream);

    outcome::result<TokenAmount> locked(const StreamId &stream,
                                        UnixTime time) const override;

   private:
    mutable std::shared_mutex mutex_;
    std::map<StreamId, LinearStream> streams_;
  };
}  // namespace fr::router
