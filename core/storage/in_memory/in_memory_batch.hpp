/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "storage/in_memory/in_memory_storage.hpp"
#include "storage/storage_error.hpp"

namespace fr::storage {

  /**
   * Optimistic batch over InMemoryStorage. Reads fall through to the storage
   * and are remembered; commit fails with StorageError::kConflict if any of
   * them was changed by another commit in the meantime.
   */
  class InMemoryBatch : public BufferBatch {
   public:
    explicit InMemoryBatch(InMemoryStorage &db) : db{db} {}

    outcome::result<Bytes> get(const Bytes &key) const override {
      const auto it{entries.find(key)};
      if (it != entries.end()) {
        if (!it->second) {
          return StorageError::kNotFound;
        }
        return *it->second;
      }
      const auto &value{observe(key)};
      if (!value) {
        return StorageError::kNotFound;
      }
      return *value;
    }

    bool contains(const Bytes &key) const override {
      const auto it{entries.find(key)};
      if (it != entries.end()) {
        return it->second.has_value();
      }
      return observe(key).has_value();
    }

    outcome::result<void> put(const Bytes &key, Bytes value) override {
      entries[key] = std::move(value);
      return outcome::success();
    }

    outcome::result<void> remove(const Bytes &key) override {
      entries[key] = boost::none;
      return outcome::success();
    }

    outcome::result<void> commit() override {
      auto result{db.apply(reads, std::move(entries))};
      entries.clear();
      reads.clear();
      return result;
    }

    void clear() override {
      entries.clear();
      reads.clear();
    }

   private:
    const boost::optional<Bytes> &observe(const Bytes &key) const {
      auto it{reads.find(key)};
      if (it == reads.end()) {
        boost::optional<Bytes> observed;
        if (auto value{db.get(key)}) {
          observed = std::move(value.value());
        }
        it = reads.emplace(key, std::move(observed)).first;
      }
      return it->second;
    }

    InMemoryStorage::Changes entries;
    mutable InMemoryStorage::Reads reads;
    InMemoryStorage &db;
  };
}  // namespace fr::storage
