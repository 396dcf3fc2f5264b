/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

/**
 * Byte keyed state of the router. Vault records, token balances and pool
 * records live side by side in one map, so a single batch over it covers
 * every effect of one router call.
 *  - BufferMap - readable and writeable bindings
 *  - BufferBatch - staged writes over a BufferMap
 *  - PersistentBufferMap - map able to open batches
 */

#include "common/bytes.hpp"
#include "storage/face/generic_map.hpp"
#include "storage/face/persistent_map.hpp"
#include "storage/face/write_batch.hpp"

namespace fr::storage {

  using BufferMap = face::GenericMap<Bytes, Bytes>;

  using BufferBatch = face::WriteBatch<Bytes, Bytes>;

  using PersistentBufferMap = face::PersistentMap<Bytes, Bytes>;

}  // namespace fr::storage
