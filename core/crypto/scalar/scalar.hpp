/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/bytes.hpp"

/**
 * Sizes of BLS12-381 scalar field element encodings
 */
namespace subspace::crypto::scalar {
  /** Size of serialized scalar */
  constexpr size_t kFullBytes{32};
  /**
   * Number of bytes that always deserialize into a valid scalar without
   * modular reduction
   */
  constexpr size_t kSafeBytes{31};

  static_assert(kSafeBytes < kFullBytes);

  using FullScalarBytes = BytesN<kFullBytes>;
  using SafeScalarBytes = BytesN<kSafeBytes>;
}  // namespace subspace::crypto::scalar
