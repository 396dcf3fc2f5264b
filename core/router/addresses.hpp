/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"
#include "router/types.hpp"

namespace fr::router {
  /// Storage keys of vault records, derived from the vault id alone
  Bytes policyKey(const VaultId &vault);
  Bytes progressKey(const VaultId &vault);
  Bytes positionKey(const VaultId &vault);

  /// Account receiving claimed fees and paying out investors and creator
  AccountId treasuryAccount(const VaultId &vault);

  /// Account owning the honorary position of the vault
  AccountId positionOwnerAccount(const VaultId &vault);
}  // namespace fr::router
