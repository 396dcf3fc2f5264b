/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "router/addresses.hpp"

namespace fr::router {
  Bytes policyKey(const VaultId &vault) {
    return bytesOf("policy/" + vault);
  }

  Bytes progressKey(const VaultId &vault) {
    return bytesOf("progress/" + vault);
  }

  Bytes positionKey(const VaultId &vault) {
    return bytesOf("position/" + vault);
  }

  AccountId treasuryAccount(const VaultId &vault) {
    return "vault/" + vault + "/treasury";
  }

  AccountId positionOwnerAccount(const VaultId &vault) {
    return "vault/" + vault + "/position_owner";
  }
}  // namespace fr::router
