/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/paid_bitmap.hpp"

namespace fr::router {
  static_assert(kMaxInvestors % 8 == 0);

  bool PaidBitmap::test(InvestorIndex index) const {
    return index < kMaxInvestors && bits_.test(index);
  }

  void PaidBitmap::set(InvestorIndex index) {
    bits_.set(index);
  }

  void PaidBitmap::clear() {
    bits_.reset();
  }

  size_t PaidBitmap::count() const {
    return bits_.count();
  }

  bool PaidBitmap::none() const {
    return bits_.none();
  }

  Bytes PaidBitmap::toBytes() const {
    Bytes bytes(kByteSize, 0);
    for (size_t i = 0; i < kMaxInvestors; ++i) {
      if (bits_.test(i)) {
        bytes[i / 8] |= static_cast<uint8_t>(1 << (i % 8));
      }
    }
    return bytes;
  }

  boost::optional<PaidBitmap> PaidBitmap::fromBytes(const Bytes &bytes) {
    if (bytes.size() != kByteSize) {
      return boost::none;
    }
    PaidBitmap bitmap;
    for (size_t i = 0; i < kMaxInvestors; ++i) {
      if ((bytes[i / 8] >> (i % 8)) & 1) {
        bitmap.bits_.set(i);
      }
    }
    return bitmap;
  }

  bool PaidBitmap::operator==(const PaidBitmap &other) const {
    return bits_ == other.bits_;
  }
}  // namespace fr::router
