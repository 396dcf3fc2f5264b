/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <memory>
#include <shared_mutex>

#include <boost/optional.hpp>

#include "common/outcome.hpp"
#include "storage/buffer_map.hpp"

namespace fr::storage {
  /**
   * Simple storage that conforms PersistentMap interface. Serves as the
   * execution substrate of the in-process router and of the tests.
   */
  class InMemoryStorage : public PersistentBufferMap {
   public:
    /// Staged value, none means removal
    using Changes = std::map<Bytes, boost::optional<Bytes>>;
    /// Value observed by a batch, none means the key was absent
    using Reads = std::map<Bytes, boost::optional<Bytes>>;

    ~InMemoryStorage() override = default;

    outcome::result<Bytes> get(const Bytes &key) const override;

    outcome::result<void> put(const Bytes &key, Bytes value) override;

    bool contains(const Bytes &key) const override;

    outcome::result<void> remove(const Bytes &key) override;

    std::unique_ptr<BufferBatch> batch() override;

    /**
     * Applies all changes under one exclusive lock, provided every observed
     * value is still current
     * @return StorageError::kConflict and nothing applied otherwise
     */
    outcome::result<void> apply(const Reads &reads, Changes changes);

   private:
    mutable std::shared_mutex mutex_;
    std::map<Bytes, Bytes> storage_;
  };

}  // namespace fr::storage
