/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "codec/scale/scale_decode_stream.hpp"
#include "codec/scale/scale_encode_stream.hpp"
#include "codec/scale/scale_errors.hpp"
#include "common/outcome.hpp"

namespace subspace::codec::scale {
  /**
   * @brief SCALE encoding to byte-vector
   * @tparam T type to be encoded
   * @param arg data to be encoded
   * @return encoded data
   */
  template <typename T>
  outcome::result<Bytes> encode(const T &arg) {
    return outcome::catchRaised([&]() -> outcome::result<Bytes> {
      ScaleEncodeStream encoder;
      encoder << arg;
      return encoder.takeData();
    });
  }

  /**
   * @brief SCALE decoding from bytes
   * Decoded value is a local of this function, use decodeInto for large
   * values that must not be placed on the stack.
   * @tparam T - type of the value to decode
   * @param input - data to decode, trailing bytes are ignored
   * @return operation result
   * @see scale_errors.hpp for possible error cases
   */
  template <typename T>
  outcome::result<T> decode(BytesIn input) {
    return outcome::catchRaised([&]() -> outcome::result<T> {
      T data{};
      ScaleDecodeStream decoder{input};
      decoder >> data;
      return data;
    });
  }

  /**
   * @brief SCALE decoding from bytes into caller provided value
   * On failure value may be partially overwritten.
   * @param input - data to decode, trailing bytes are ignored
   * @param out - value to decode into
   */
  template <typename T>
  outcome::result<void> decodeInto(BytesIn input, T &out) {
    return outcome::catchRaised([&]() -> outcome::result<void> {
      ScaleDecodeStream decoder{input};
      decoder >> out;
      return outcome::success();
    });
  }
}  // namespace subspace::codec::scale
