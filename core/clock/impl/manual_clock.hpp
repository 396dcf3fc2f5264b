/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "clock/utc_clock.hpp"

namespace fr::clock {
  /**
   * Clock which only moves when told to, used to replay distribution days
   */
  class ManualClock : public UTCClock {
   public:
    explicit ManualClock(UnixTime start) : now_{start.count()} {}

    microseconds nowMicro() const override {
      return std::chrono::duration_cast<microseconds>(UnixTime{now_.load()});
    }

    void advance(UnixTime delta) {
      now_ += delta.count();
    }

   private:
    std::atomic<int64_t> now_;
  };
}  // namespace fr::clock
