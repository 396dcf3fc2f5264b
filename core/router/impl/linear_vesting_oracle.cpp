/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/impl/linear_vesting_oracle.hpp"

#include <mutex>

#include "router/fee_math.hpp"
#include "router/router_error.hpp"

namespace fr::router {
  TokenAmount LinearStream::unlocked(UnixTime time) const {
    if (time < cliff || time < start) {
      return 0;
    }
    if (time >= end) {
      return deposited;
    }
    const auto linear{deposited - cliff_amount};
    const auto elapsed{static_cast<uint64_t>((time - cliff).count())};
    const auto duration{static_cast<uint64_t>((end - cliff).count())};
    // elapsed < duration, so released stays below linear
    const math::uint128_t released{math::uint128_t{linear} * elapsed
                                   / duration};
    return std::min(deposited,
                    cliff_amount + released.convert_to<TokenAmount>());
  }

  outcome::result<void> LinearVestingOracle::addStream(const StreamId &id,
                                                       LinearStream stream) {
    if (stream.cliff < stream.start || stream.end < stream.cliff
        || stream.cliff_amount > stream.deposited) {
      return RouterError::kInsufficientVestingData;
    }
    std::unique_lock lock{mutex_};
    streams_[id] = stream;
    return outcome::success();
  }

  outcome::result<TokenAmount> LinearVestingOracle::locked(
      const StreamId &stream, UnixTime time) const {
    std::shared_lock lock{mutex_};
    const auto it{streams_.find(stream)};
    if (it == streams_.end()) {
      return RouterError::kInsufficientVestingData;
    }
    return it->second.deposited - it->second.unlocked(time);
  }
}  // namespace fr::router
