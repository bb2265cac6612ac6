/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <cstdint>
#include <gsl/span>
#include <vector>

#include "common/cmp.hpp"

namespace subspace {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  template <size_t N>
  using BytesN = std::array<uint8_t, N>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }
  void copy(Bytes &&) = delete;

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }
}  // namespace subspace

namespace gsl {
  inline bool operator==(const subspace::Bytes &l, const subspace::BytesIn &r) {
    return subspace::BytesIn{l} == r;
  }
  inline bool operator==(const subspace::BytesIn &l, const subspace::Bytes &r) {
    return l == subspace::BytesIn{r};
  }
  SUBSPACE_OPERATOR_NOT_EQUAL_2(subspace::Bytes, subspace::BytesIn)
  SUBSPACE_OPERATOR_NOT_EQUAL_2(subspace::BytesIn, subspace::Bytes)
}  // namespace gsl
