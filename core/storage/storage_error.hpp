/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace fr::storage {

  /**
   * @brief Errors of key-value storages
   */
  enum class StorageError {
    kNotFound = 1,
    kConflict,
  };

}  // namespace fr::storage

OUTCOME_HPP_DECLARE_ERROR(fr::storage, StorageError);
