/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host/messenger/runtime_interface.hpp"

namespace subspace::host::messenger {
  boost::optional<Bytes> getStorageKey(const Externalities &externalities,
                                       const StorageKeyRequest &request) {
    const auto *extension{externalities.extension<MessengerExtension>()};
    if (!extension) {
      missingExtension("MessengerExtension");
    }
    return extension->getStorageKey(request);
  }
}  // namespace subspace::host::messenger
