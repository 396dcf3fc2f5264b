/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "storage/storage_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(fr::storage, StorageError, e) {
  using fr::storage::StorageError;
  switch (e) {
    case StorageError::kNotFound:
      return "StorageError: key not found";
    case StorageError::kConflict:
      return "StorageError: batch read a value changed by a concurrent commit";
  }
  return "StorageError: unknown error";
}
