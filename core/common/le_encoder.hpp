/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <boost/endian/buffers.hpp>
#include <boost/optional.hpp>

#include "common/bytes.hpp"

namespace fr::common {
  /**
   * @brief little-endian -encodes an integral value
   * @tparam T integral value type
   * @param value integral value to encode
   * @param out output buffer
   */
  template <class T,
            typename I = std::decay_t<T>,
            typename = std::enable_if_t<std::is_integral<I>::value>>
  void encodeInteger(T value, Bytes &out) {  // no need to take integers by &&
    constexpr size_t size = sizeof(T);
    constexpr size_t bits = size * 8;
    boost::endian::endian_buffer<boost::endian::order::little, I, bits> buf{};
    buf = static_cast<I>(value);  // cannot initialize, only assign
    for (size_t i = 0; i < size; ++i) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      out.push_back(static_cast<uint8_t>(buf.data()[i]));
    }
  }

  /**
   * @brief encodes string as u32 length prefix followed by its characters
   */
  inline void encodeString(std::string_view value, Bytes &out) {
    encodeInteger(static_cast<uint32_t>(value.size()), out);
    out.insert(out.end(), value.begin(), value.end());
  }

  /**
   * Sequential little-endian reader over a byte buffer.
   * Every read returns none once the buffer is exhausted.
   */
  class LeDecoder {
   public:
    explicit LeDecoder(const Bytes &input) : input_{input} {}

    template <class T,
              typename = std::enable_if_t<std::is_integral<T>::value>>
    boost::optional<T> integer() {
      constexpr size_t size = sizeof(T);
      if (input_.size() - offset_ < size) {
        return boost::none;
      }
      boost::endian::endian_buffer<boost::endian::order::little, T, size * 8>
          buf{};
      std::copy_n(input_.begin() + offset_, size, buf.data());
      offset_ += size;
      return buf.value();
    }

    boost::optional<std::string> string() {
      const auto size{integer<uint32_t>()};
      if (!size || input_.size() - offset_ < *size) {
        return boost::none;
      }
      std::string value(input_.begin() + offset_,
                        input_.begin() + offset_ + *size);
      offset_ += *size;
      return value;
    }

    boost::optional<Bytes> bytes(size_t size) {
      if (input_.size() - offset_ < size) {
        return boost::none;
      }
      Bytes value(input_.begin() + offset_, input_.begin() + offset_ + size);
      offset_ += size;
      return value;
    }

    bool empty() const {
      return offset_ == input_.size();
    }

   private:
    const Bytes &input_;
    size_t offset_{0};
  };
}  // namespace fr::common
