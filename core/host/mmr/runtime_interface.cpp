/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host/mmr/runtime_interface.hpp"

namespace subspace::host::mmr {
  namespace {
    const MmrExtension &mmrExtension(const Externalities &externalities) {
      const auto *extension{externalities.extension<MmrExtension>()};
      if (!extension) {
        missingExtension("MmrExtension");
      }
      return *extension;
    }
  }  // namespace

  boost::optional<LeafData> getMmrLeafData(const Externalities &externalities,
                                           const Hash256 &consensus_block_hash) {
    return mmrExtension(externalities).getMmrLeafData(consensus_block_hash);
  }

  bool verifyMmrProof(const Externalities &externalities,
                      const std::vector<EncodableOpaqueLeaf> &leaves,
                      const Bytes &encoded_proof) {
    return mmrExtension(externalities).verifyMmrProof(leaves, encoded_proof);
  }
}  // namespace subspace::host::mmr
