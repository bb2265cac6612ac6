/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include "common/cmp.hpp"

namespace subspace::codec::scale {
  /** Upper bounds of compact integer single byte, two byte and four byte
   * modes */
  constexpr uint64_t kCompactSingleByteLimit{1ull << 6};
  constexpr uint64_t kCompactTwoByteLimit{1ull << 14};
  constexpr uint64_t kCompactFourByteLimit{1ull << 30};

  /**
   * Integer in SCALE compact encoding. Used for collection lengths.
   */
  struct CompactInteger {
    uint64_t value{};
  };

  inline bool operator==(const CompactInteger &lhs, const CompactInteger &rhs) {
    return lhs.value == rhs.value;
  }
  SUBSPACE_OPERATOR_NOT_EQUAL(CompactInteger)
}  // namespace subspace::codec::scale
