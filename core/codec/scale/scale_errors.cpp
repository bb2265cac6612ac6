/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/scale/scale_errors.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subspace::codec::scale, ScaleDecodeError, e) {
  using subspace::codec::scale::ScaleDecodeError;
  switch (e) {
    case ScaleDecodeError::kNotEnoughData:
      return "SCALE decode: not enough data to decode";
    case ScaleDecodeError::kUnexpectedValue:
      return "SCALE decode: unexpected value";
    case ScaleDecodeError::kTooManyItems:
      return "SCALE decode: collection is larger than remaining input";
    case ScaleDecodeError::kCompactOverflow:
      return "SCALE decode: compact integer does not fit 64 bits";
    default:
      return "SCALE decode: unknown error";
  }
}
