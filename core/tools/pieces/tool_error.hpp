/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace subspace::tools::pieces {
  enum class ToolError {
    kInputSizeNotMultiple = 1,
    kUnknownFormat,
  };
}  // namespace subspace::tools::pieces

OUTCOME_HPP_DECLARE_ERROR(subspace::tools::pieces, ToolError);
