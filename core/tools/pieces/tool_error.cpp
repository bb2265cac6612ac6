/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tools/pieces/tool_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subspace::tools::pieces, ToolError, e) {
  using E = subspace::tools::pieces::ToolError;
  switch (e) {
    case E::kInputSizeNotMultiple:
      return "Input size is not a multiple of piece size";
    case E::kUnknownFormat:
      return "Unknown input format, expected raw or scale";
  }
  return "unknown error";
}
