/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/pieces/piece_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subspace::primitives::pieces, PieceError, e) {
  using subspace::primitives::pieces::PieceError;

  switch (e) {
    case (PieceError::kLengthMismatch):
      return "Piece: input length does not match piece size";
    case (PieceError::kDecodeTruncated):
      return "Could not decode Piece: not enough data";
    default:
      return "Piece: unknown error";
  }
}
