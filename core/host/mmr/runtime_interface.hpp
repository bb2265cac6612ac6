/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "host/externalities.hpp"
#include "host/mmr/mmr_extension.hpp"

/**
 * MMR functions callable by the runtime. Abort the process when MmrExtension
 * is not registered in externalities.
 */
namespace subspace::host::mmr {
  boost::optional<LeafData> getMmrLeafData(const Externalities &externalities,
                                           const Hash256 &consensus_block_hash);

  bool verifyMmrProof(const Externalities &externalities,
                      const std::vector<EncodableOpaqueLeaf> &leaves,
                      const Bytes &encoded_proof);
}  // namespace subspace::host::mmr
