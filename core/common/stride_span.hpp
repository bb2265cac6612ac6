/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>
#include <iterator>
#include <type_traits>

#include <boost/assert.hpp>

#include "common/layout.hpp"

namespace subspace::common {
  /**
   * Non-owning view of `count` values of byte container type T placed every
   * `stride` bytes of contiguous memory. Elements are viewed in place, the
   * span may be iterated any number of times.
   * Const T gives read-only access, non-const T gives write access.
   */
  template <typename T>
  class StrideSpan {
   public:
    using Byte =
        std::conditional_t<std::is_const_v<T>, const uint8_t, uint8_t>;
    using value_type = std::remove_const_t<T>;

    class Iterator {
     public:
      using iterator_category = std::forward_iterator_tag;
      using value_type = std::remove_const_t<T>;
      using difference_type = std::ptrdiff_t;
      using pointer = T *;
      using reference = T &;

      Iterator() = default;
      Iterator(Byte *data, size_t stride, size_t index)
          : data_{data}, stride_{stride}, index_{index} {}

      reference operator*() const {
        return element(data_, stride_, index_);
      }

      pointer operator->() const {
        return &element(data_, stride_, index_);
      }

      Iterator &operator++() {
        ++index_;
        return *this;
      }

      Iterator operator++(int) {
        auto copy{*this};
        ++index_;
        return copy;
      }

      bool operator==(const Iterator &other) const {
        return data_ == other.data_ && index_ == other.index_;
      }

      bool operator!=(const Iterator &other) const {
        return !(*this == other);
      }

     private:
      Byte *data_{nullptr};
      size_t stride_{0};
      size_t index_{0};
    };

    StrideSpan() = default;

    /**
     * @param data - first byte of the first element
     * @param count - number of elements
     * @param stride - distance in bytes between starts of two elements, not
     * less than sizeof(T)
     */
    StrideSpan(Byte *data, size_t count, size_t stride)
        : data_{data}, count_{count}, stride_{stride} {
      BOOST_ASSERT(stride_ >= sizeof(T));
    }

    size_t size() const {
      return count_;
    }

    bool empty() const {
      return count_ == 0;
    }

    T &operator[](size_t index) const {
      BOOST_ASSERT(index < count_);
      return element(data_, stride_, index);
    }

    T &front() const {
      return (*this)[0];
    }

    T &back() const {
      return (*this)[count_ - 1];
    }

    Iterator begin() const {
      return {data_, stride_, 0};
    }

    Iterator end() const {
      return {data_, stride_, count_};
    }

   private:
    static T &element(Byte *data, size_t stride, size_t index) {
      // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      auto *begin = data + index * stride;
      return layout::view<value_type>(gsl::make_span(begin, sizeof(T)));
    }

    Byte *data_{nullptr};
    size_t count_{0};
    size_t stride_{sizeof(T)};
  };
}  // namespace subspace::common
