/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

namespace subspace::codec::scale {
  class ScaleDecodeStream;
  class ScaleEncodeStream;
}  // namespace subspace::codec::scale

#define SCALE_DECODE(...)                               \
  /* NOLINTNEXTLINE(bugprone-macro-parentheses) */      \
  ::subspace::codec::scale::ScaleDecodeStream &operator>>( \
      ::subspace::codec::scale::ScaleDecodeStream &s, __VA_ARGS__ &v)
#define SCALE_ENCODE(...)                                  \
  ::subspace::codec::scale::ScaleEncodeStream &operator<<( \
      ::subspace::codec::scale::ScaleEncodeStream &s, const __VA_ARGS__ &v)
#define SCALE_DECODE_ENCODE(...) \
  SCALE_DECODE(__VA_ARGS__);     \
  SCALE_ENCODE(__VA_ARGS__);

// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _SCALE_TUPLE_1(op, m) op v.m
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _SCALE_TUPLE_2(op, m, ...) \
  _SCALE_TUPLE_1(op, m) _SCALE_TUPLE_1(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _SCALE_TUPLE_3(op, m, ...) \
  _SCALE_TUPLE_1(op, m) _SCALE_TUPLE_2(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _SCALE_TUPLE_4(op, m, ...) \
  _SCALE_TUPLE_1(op, m) _SCALE_TUPLE_3(op, __VA_ARGS__)
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _SCALE_TUPLE_V(_1, _2, _3, _4, f, ...) f
// NOLINTNEXTLINE(bugprone-reserved-identifier)
#define _SCALE_TUPLE(op, ...)   \
  _SCALE_TUPLE_V(__VA_ARGS__,   \
                 _SCALE_TUPLE_4, \
                 _SCALE_TUPLE_3, \
                 _SCALE_TUPLE_2, \
                 _SCALE_TUPLE_1) \
  (op, __VA_ARGS__)

/**
 * Encodes struct fields one after another, in declaration order given
 */
#define SCALE_TUPLE(T, ...)                 \
  inline SCALE_ENCODE(T) {                  \
    return s _SCALE_TUPLE(<<, __VA_ARGS__); \
  }                                         \
  inline SCALE_DECODE(T) {                  \
    return s _SCALE_TUPLE(>>, __VA_ARGS__); \
  }
