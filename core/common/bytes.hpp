/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace fr {
  using Bytes = std::vector<uint8_t>;

  inline Bytes bytesOf(std::string_view s) {
    return {s.begin(), s.end()};
  }

  inline void append(Bytes &l, const Bytes &r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace fr
