/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <type_traits>
#include <vector>

#include <boost/endian/conversion.hpp>
#include <boost/optional.hpp>

#include "codec/scale/scale_common.hpp"
#include "codec/scale/scale_errors.hpp"
#include "codec/scale/streams_annotation.hpp"
#include "common/bytes.hpp"

namespace subspace::codec::scale {
  /**
   * Decodes SCALE.
   * Raises std::system_error with ScaleDecodeError when input is malformed.
   */
  class ScaleDecodeStream {
   public:
    static constexpr auto is_scale_decoder_stream = true;

    explicit ScaleDecodeStream(BytesIn data);

    /** Decodes fixed width little-endian integer or one byte bool */
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>>>
    ScaleDecodeStream &operator>>(T &num) {
      if constexpr (std::is_same_v<T, bool>) {
        num = readBool();
      } else {
        BytesN<sizeof(T)> bytes{};
        readInto(bytes);
        num = boost::endian::
            endian_load<T, sizeof(T), boost::endian::order::little>(
                bytes.data());
      }
      return *this;
    }

    /** Decodes fixed size byte array in place */
    template <size_t N>
    ScaleDecodeStream &operator>>(std::array<uint8_t, N> &bytes) {
      readInto(gsl::make_span(bytes.data(), N));
      return *this;
    }

    /** Decodes bytes with compact length prefix */
    ScaleDecodeStream &operator>>(Bytes &bytes);

    /**
     * Decodes elements with compact length prefix. Each element is decoded in
     * place inside vector storage. Preallocation is bounded by remaining
     * input size.
     */
    template <typename T>
    ScaleDecodeStream &operator>>(std::vector<T> &values) {
      const auto count{readLength()};
      values.clear();
      values.reserve(std::min(count, remaining() / sizeof(T)));
      for (size_t i{0}; i < count; ++i) {
        *this >> values.emplace_back();
      }
      return *this;
    }

    /** Decodes optional value with one byte presence tag */
    template <typename T>
    ScaleDecodeStream &operator>>(boost::optional<T> &optional) {
      uint8_t tag{};
      *this >> tag;
      if constexpr (std::is_same_v<T, bool>) {
        switch (tag) {
          case 0:
            optional = boost::none;
            break;
          case 1:
            optional = true;
            break;
          case 2:
            optional = false;
            break;
          default:
            raiseUnexpectedValue();
        }
      } else {
        if (tag == 0) {
          optional = boost::none;
        } else if (tag == 1) {
          T value{};
          *this >> value;
          optional = std::move(value);
        } else {
          raiseUnexpectedValue();
        }
      }
      return *this;
    }

    /** Decodes compact integer */
    ScaleDecodeStream &operator>>(CompactInteger &compact);

    /**
     * Copies exactly out.size() bytes into caller provided memory
     * @param out - destination
     */
    void readInto(BytesOut out);

    /**
     * Reads compact length prefix of a collection and checks that each item
     * can be backed by at least one byte of remaining input
     */
    size_t readLength();

    /** Returns count of bytes not decoded yet */
    size_t remaining() const;

    /** Checks whether at least n bytes are left */
    bool hasMore(size_t n) const;

   private:
    bool readBool();
    [[noreturn]] static void raiseUnexpectedValue();

    BytesIn input_;
  };
}  // namespace subspace::codec::scale
