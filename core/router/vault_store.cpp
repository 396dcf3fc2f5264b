/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/vault_store.hpp"

#include "router/addresses.hpp"
#include "router/record_codec.hpp"
#include "router/router_error.hpp"

namespace fr::router {
  bool VaultStore::hasPolicy(const VaultId &vault) const {
    return map_.contains(policyKey(vault));
  }

  outcome::result<Policy> VaultStore::policy(const VaultId &vault) const {
    const auto key{policyKey(vault)};
    if (!map_.contains(key)) {
      return RouterError::kPolicyNotFound;
    }
    OUTCOME_TRY(bytes, map_.get(key));
    return codec::decode<Policy>(bytes);
  }

  outcome::result<void> VaultStore::putPolicy(const Policy &policy) {
    return map_.put(policyKey(policy.vault), codec::encode(policy));
  }

  outcome::result<DistributionProgress> VaultStore::progress(
      const VaultId &vault) const {
    const auto key{progressKey(vault)};
    if (!map_.contains(key)) {
      return RouterError::kPolicyNotFound;
    }
    OUTCOME_TRY(bytes, map_.get(key));
    return codec::decode<DistributionProgress>(bytes);
  }

  outcome::result<void> VaultStore::putProgress(
      const DistributionProgress &progress) {
    return map_.put(progressKey(progress.vault), codec::encode(progress));
  }

  bool VaultStore::hasPosition(const VaultId &vault) const {
    return map_.contains(positionKey(vault));
  }

  outcome::result<HonoraryPosition> VaultStore::position(
      const VaultId &vault) const {
    const auto key{positionKey(vault)};
    if (!map_.contains(key)) {
      return RouterError::kPositionNotFound;
    }
    OUTCOME_TRY(bytes, map_.get(key));
    return codec::decode<HonoraryPosition>(bytes);
  }

  outcome::result<void> VaultStore::putPosition(
      const HonoraryPosition &position) {
    return map_.put(positionKey(position.vault), codec::encode(position));
  }
}  // namespace fr::router
