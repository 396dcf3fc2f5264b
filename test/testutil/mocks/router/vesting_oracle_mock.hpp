/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "router/vesting_oracle.hpp"

namespace fr::router {
  class VestingOracleMock : public VestingOracle {
   public:
    MOCK_CONST_METHOD2(locked,
                       outcome::result<TokenAmount>(const StreamId &,
                                                    UnixTime));
  };
}  // namespace fr::router
