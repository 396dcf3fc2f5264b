/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FEE_ROUTER_PERSISTENT_MAP_HPP
#define CPP_FEE_ROUTER_PERSISTENT_MAP_HPP

#include <memory>

#include "storage/face/generic_map.hpp"
#include "storage/face/write_batch.hpp"

namespace fr::storage::face {

  /**
   * @brief An abstraction over a map accessible via filesystem or remove
   * connection. It supports batching for atomic modifications.
   * @tparam K key type
   * @tparam V value type
   */
  template <typename K, typename V>
  struct PersistentMap : public GenericMap<K, V> {
    /**
     * @brief Creates new Write Batch - an object, which stages writes and
     * applies them atomically on commit.
     */
    virtual std::unique_ptr<WriteBatch<K, V>> batch() = 0;
  };

}  // namespace fr::storage::face

#endif  // CPP_FEE_ROUTER_PERSISTENT_MAP_HPP
