/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <boost/optional.hpp>

#include "codec/scale/scale_decode_stream.hpp"
#include "codec/scale/scale_encode_stream.hpp"
#include "common/blob.hpp"

namespace subspace::host::mmr {
  using common::Hash256;

  /**
   * Leaf data sent back from host
   */
  struct LeafData {
    Hash256 state_root;
    Hash256 extrinsics_root;
  };

  inline bool operator==(const LeafData &lhs, const LeafData &rhs) {
    return lhs.state_root == rhs.state_root
           && lhs.extrinsics_root == rhs.extrinsics_root;
  }
  SUBSPACE_OPERATOR_NOT_EQUAL(LeafData)

  SCALE_TUPLE(LeafData, state_root, extrinsics_root)

  /** Encoded MMR leaf, opaque to the runtime */
  using EncodableOpaqueLeaf = Bytes;

  /**
   * Merkle mountain range capabilities provided by the host
   */
  class MmrExtension {
   public:
    virtual ~MmrExtension() = default;

    /**
     * @param consensus_block_hash - consensus block to look up
     * @return leaf data or none if block is unknown to the host
     */
    virtual boost::optional<LeafData> getMmrLeafData(
        const Hash256 &consensus_block_hash) const = 0;

    /**
     * Verifies MMR proof of given leaves
     * @return false if proof is malformed or does not match the leaves
     */
    virtual bool verifyMmrProof(const std::vector<EncodableOpaqueLeaf> &leaves,
                                const Bytes &encoded_proof) const = 0;
  };
}  // namespace subspace::host::mmr
