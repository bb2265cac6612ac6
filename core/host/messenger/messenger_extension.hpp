/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/optional.hpp>

#include "codec/scale/scale_decode_stream.hpp"
#include "codec/scale/scale_encode_stream.hpp"
#include "common/bytes.hpp"

namespace subspace::host::messenger {
  /**
   * Storage key request, encoded by the runtime and interpreted by the host
   */
  struct StorageKeyRequest {
    Bytes encoded;
  };

  inline bool operator==(const StorageKeyRequest &lhs,
                         const StorageKeyRequest &rhs) {
    return lhs.encoded == rhs.encoded;
  }
  SUBSPACE_OPERATOR_NOT_EQUAL(StorageKeyRequest)

  SCALE_TUPLE(StorageKeyRequest, encoded)

  class MessengerExtension {
   public:
    virtual ~MessengerExtension() = default;

    /**
     * @return storage key for request or none if there is no such key
     */
    virtual boost::optional<Bytes> getStorageKey(
        const StorageKeyRequest &request) const = 0;
  };
}  // namespace subspace::host::messenger
