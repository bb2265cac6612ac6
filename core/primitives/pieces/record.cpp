/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/pieces/record.hpp"

namespace subspace::primitives::pieces {
  using crypto::scalar::kFullBytes;

  Record::FullScalarArrays Record::fullScalarArrays() const {
    return {data(), kNumScalars, kFullBytes};
  }

  Record::FullScalarArraysMut Record::fullScalarArraysMut() {
    return {data(), kNumScalars, kFullBytes};
  }

  Record::SafeScalarArrays Record::safeScalarArrays() const {
    return {data(), kNumScalars, kFullBytes};
  }

  Record::SafeScalarArraysMut Record::safeScalarArraysMut() {
    return {data(), kNumScalars, kFullBytes};
  }
}  // namespace subspace::primitives::pieces
