/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace subspace::codec::scale {
  enum class ScaleDecodeError {
    kNotEnoughData = 1,
    kUnexpectedValue,
    kTooManyItems,
    kCompactOverflow,
  };
}  // namespace subspace::codec::scale

OUTCOME_HPP_DECLARE_ERROR(subspace::codec::scale, ScaleDecodeError);
