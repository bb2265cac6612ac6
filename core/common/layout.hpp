/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <type_traits>

#include <boost/assert.hpp>

#include "common/bytes.hpp"
#include "common/span.hpp"

/**
 * Checks that T is a plain byte container of exactly `size` bytes: no
 * padding, no hidden members, byte alignment.
 */
#define SUBSPACE_ASSERT_BYTE_LAYOUT(T, size)                          \
  static_assert(sizeof(T) == (size), #T " must have no padding");     \
  static_assert(alignof(T) == 1, #T " must be byte aligned");         \
  static_assert(std::is_standard_layout_v<T>,                         \
                #T " must be standard layout");                       \
  static_assert(std::is_trivially_copyable_v<T>,                      \
                #T " must be trivially copyable")

/**
 * The only place where raw memory is reinterpreted as fixed-size byte
 * containers. Every view over pieces, records and their chunks goes through
 * these functions.
 */
namespace subspace::common::layout {
  template <typename T>
  constexpr void checkByteLayout() {
    static_assert(alignof(T) == 1);
    static_assert(std::is_standard_layout_v<T>);
    static_assert(std::is_trivially_copyable_v<T>);
  }

  /**
   * Views `sizeof(T)` bytes as T without copying.
   * @param bytes - memory of exactly `sizeof(T)` bytes
   */
  template <typename T>
  const T &view(BytesIn bytes) {
    checkByteLayout<T>();
    BOOST_ASSERT(static_cast<size_t>(bytes.size()) == sizeof(T));
    return *span::cast<const T>(bytes.data());
  }

  /**
   * Views `sizeof(T)` bytes as mutable T without copying.
   * @param bytes - memory of exactly `sizeof(T)` bytes
   */
  template <typename T>
  T &view(BytesOut bytes) {
    checkByteLayout<T>();
    BOOST_ASSERT(static_cast<size_t>(bytes.size()) == sizeof(T));
    return *span::cast<T>(bytes.data());
  }

  /**
   * Views contiguous values as one byte range without copying.
   */
  template <typename T>
  BytesIn bytesOf(gsl::span<const T> values) {
    checkByteLayout<T>();
    return gsl::make_span(span::cast<const uint8_t>(values.data()),
                          values.size_bytes());
  }

  /**
   * Views contiguous values as one mutable byte range without copying.
   */
  template <typename T>
  BytesOut bytesOf(gsl::span<T> values) {
    static_assert(!std::is_const_v<T>);
    checkByteLayout<T>();
    return gsl::make_span(span::cast<uint8_t>(values.data()),
                          values.size_bytes());
  }
}  // namespace subspace::common::layout
