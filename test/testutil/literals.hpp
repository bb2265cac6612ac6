/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/hexutil.hpp"

inline std::vector<uint8_t> operator""_unhex(const char *c, size_t s) {
  return subspace::common::unhex(std::string_view(c, s)).value();
}

inline subspace::common::Hash256 operator""_hash256(const char *c, size_t s) {
  return subspace::common::Hash256::fromHex(std::string_view(c, s)).value();
}

inline subspace::common::Blob<48> operator""_blob48(const char *c, size_t s) {
  return subspace::common::Blob<48>::fromHex(std::string_view(c, s)).value();
}
