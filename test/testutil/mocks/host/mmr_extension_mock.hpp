/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <gmock/gmock.h>

#include "host/mmr/mmr_extension.hpp"
#include "testutil/default_print.hpp"

namespace subspace::host::mmr {
  class MmrExtensionMock : public MmrExtension {
   public:
    MOCK_CONST_METHOD1(getMmrLeafData,
                       boost::optional<LeafData>(const Hash256 &));
    MOCK_CONST_METHOD2(
        verifyMmrProof,
        bool(const std::vector<EncodableOpaqueLeaf> &, const Bytes &));
  };
}  // namespace subspace::host::mmr
