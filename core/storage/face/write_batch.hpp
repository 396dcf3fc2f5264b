/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FEE_ROUTER_WRITE_BATCH_HPP
#define CPP_FEE_ROUTER_WRITE_BATCH_HPP

#include "storage/face/generic_map.hpp"

namespace fr::storage::face {

  /**
   * @brief Staged modifications of a storage. Reads observe staged writes
   * first and fall through to the storage; nothing reaches the storage until
   * commit, which applies all staged writes as one unit.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct WriteBatch : public GenericMap<K, V> {
    /**
     * @brief Writes batch.
     * @return error code in case of error.
     */
    virtual outcome::result<void> commit() = 0;

    /**
     * @brief Clear batch.
     */
    virtual void clear() = 0;
  };

}  // namespace fr::storage::face

#endif  // CPP_FEE_ROUTER_WRITE_BATCH_HPP
