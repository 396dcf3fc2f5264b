/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FEE_ROUTER_READABLE_MAP_HPP
#define CPP_FEE_ROUTER_READABLE_MAP_HPP

#include "common/outcome.hpp"

namespace fr::storage::face {

  /**
   * @brief A mixin for read-only map.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct ReadableMap {
    virtual ~ReadableMap() = default;

    /**
     * @brief Get value by key
     * @param key K
     * @return V, or StorageError::kNotFound if there is no value for key
     */
    virtual outcome::result<V> get(const K &key) const = 0;

    /**
     * @brief Returns true if given key-value binding exists in the storage.
     * @param key K
     * @return true if key has value, false if does not, or error at .
     */
    virtual bool contains(const K &key) const = 0;
  };

}  // namespace fr::storage::face

#endif  // CPP_FEE_ROUTER_READABLE_MAP_HPP
