/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <bitset>

#include <boost/optional.hpp>

#include "common/bytes.hpp"
#include "router/constants.hpp"

namespace fr::router {
  /**
   * Fixed capacity set of investor indices paid during the current day
   */
  class PaidBitmap {
   public:
    /// Size of the serialized form
    static constexpr size_t kByteSize{kMaxInvestors / 8};

    bool test(InvestorIndex index) const;

    /// Marks investor as paid, index must be below kMaxInvestors
    void set(InvestorIndex index);

    void clear();

    size_t count() const;

    bool none() const;

    /// Bit i is bit (i % 8) of byte (i / 8)
    Bytes toBytes() const;

    static boost::optional<PaidBitmap> fromBytes(const Bytes &bytes);

    bool operator==(const PaidBitmap &other) const;

   private:
    std::bitset<kMaxInvestors> bits_;
  };
}  // namespace fr::router
