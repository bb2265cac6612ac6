/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "host/externalities.hpp"
#include "host/messenger/messenger_extension.hpp"

namespace subspace::host::messenger {
  /**
   * Storage key lookup callable by the runtime. Aborts the process when
   * MessengerExtension is not registered in externalities.
   */
  boost::optional<Bytes> getStorageKey(const Externalities &externalities,
                                       const StorageKeyRequest &request);
}  // namespace subspace::host::messenger
