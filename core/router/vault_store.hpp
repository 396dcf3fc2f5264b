/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "router/policy.hpp"
#include "router/position.hpp"
#include "router/progress.hpp"
#include "storage/buffer_map.hpp"

namespace fr::router {
  /**
   * Typed access to the records of a vault kept in a key-value storage
   */
  class VaultStore {
   public:
    explicit VaultStore(storage::BufferMap &map) : map_{map} {}

    bool hasPolicy(const VaultId &vault) const;
    /// kPolicyNotFound if the vault has no policy
    outcome::result<Policy> policy(const VaultId &vault) const;
    outcome::result<void> putPolicy(const Policy &policy);

    /// kPolicyNotFound if the vault has no policy
    outcome::result<DistributionProgress> progress(const VaultId &vault) const;
    outcome::result<void> putProgress(const DistributionProgress &progress);

    bool hasPosition(const VaultId &vault) const;
    /// kPositionNotFound if the vault has no honorary position
    outcome::result<HonoraryPosition> position(const VaultId &vault) const;
    outcome::result<void> putPosition(const HonoraryPosition &position);

   private:
    storage::BufferMap &map_;
  };
}  // namespace fr::router
