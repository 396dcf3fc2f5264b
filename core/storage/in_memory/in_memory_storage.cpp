/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/in_memory/in_memory_storage.hpp"

#include "storage/in_memory/in_memory_batch.hpp"
#include "storage/storage_error.hpp"

namespace fr::storage {

  outcome::result<Bytes> InMemoryStorage::get(const Bytes &key) const {
    std::shared_lock lock{mutex_};
    const auto it{storage_.find(key)};
    if (it == storage_.end()) {
      return StorageError::kNotFound;
    }
    return it->second;
  }

  outcome::result<void> InMemoryStorage::put(const Bytes &key, Bytes value) {
    std::unique_lock lock{mutex_};
    storage_[key] = std::move(value);
    return outcome::success();
  }

  bool InMemoryStorage::contains(const Bytes &key) const {
    std::shared_lock lock{mutex_};
    return storage_.find(key) != storage_.end();
  }

  outcome::result<void> InMemoryStorage::remove(const Bytes &key) {
    std::unique_lock lock{mutex_};
    storage_.erase(key);
    return outcome::success();
  }

  std::unique_ptr<BufferBatch> InMemoryStorage::batch() {
    return std::make_unique<InMemoryBatch>(*this);
  }

  outcome::result<void> InMemoryStorage::apply(const Reads &reads,
                                               Changes changes) {
    std::unique_lock lock{mutex_};
    for (const auto &[key, observed] : reads) {
      const auto it{storage_.find(key)};
      const auto present{it != storage_.end()};
      if (present != observed.has_value()
          || (present && it->second != *observed)) {
        return StorageError::kConflict;
      }
    }
    for (auto &[key, value] : changes) {
      if (value) {
        storage_[key] = std::move(*value);
      } else {
        storage_.erase(key);
      }
    }
    return outcome::success();
  }
}  // namespace fr::storage
