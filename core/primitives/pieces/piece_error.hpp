/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace subspace::primitives::pieces {

  /**
   * @brief Pieces returns these types of errors
   */
  enum class PieceError {
    kLengthMismatch = 1,
    kDecodeTruncated,
  };

}  // namespace subspace::primitives::pieces

OUTCOME_HPP_DECLARE_ERROR(subspace::primitives::pieces, PieceError);
