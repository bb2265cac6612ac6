/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>
#include <type_traits>
#include <vector>

#include <boost/endian/conversion.hpp>
#include <boost/optional.hpp>

#include "codec/scale/scale_common.hpp"
#include "codec/scale/streams_annotation.hpp"
#include "common/bytes.hpp"

namespace subspace::codec::scale {
  /** Encodes SCALE */
  class ScaleEncodeStream {
   public:
    static constexpr auto is_scale_encoder_stream = true;

    /** Encodes integer as fixed width little-endian or bool as one byte */
    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>>>
    ScaleEncodeStream &operator<<(T num) {
      if constexpr (std::is_same_v<T, bool>) {
        data_.push_back(num ? 1 : 0);
      } else {
        BytesN<sizeof(T)> bytes{};
        boost::endian::endian_store<T, sizeof(T), boost::endian::order::little>(
            bytes.data(), num);
        putBytes(bytes);
      }
      return *this;
    }

    /** Encodes fixed size byte array as is, without length prefix */
    template <size_t N>
    ScaleEncodeStream &operator<<(const std::array<uint8_t, N> &bytes) {
      return putBytes(gsl::make_span(bytes.data(), N));
    }

    /** Encodes bytes with compact length prefix */
    ScaleEncodeStream &operator<<(const Bytes &bytes);

    /** Encodes elements with compact length prefix */
    template <typename T>
    ScaleEncodeStream &operator<<(const std::vector<T> &values) {
      *this << CompactInteger{values.size()};
      for (const auto &value : values) {
        *this << value;
      }
      return *this;
    }

    /** Encodes optional value with one byte presence tag */
    template <typename T>
    ScaleEncodeStream &operator<<(const boost::optional<T> &optional) {
      if constexpr (std::is_same_v<T, bool>) {
        data_.push_back(optional ? (*optional ? 1 : 2) : 0);
      } else if (optional) {
        data_.push_back(1);
        *this << *optional;
      } else {
        data_.push_back(0);
      }
      return *this;
    }

    /** Encodes compact integer */
    ScaleEncodeStream &operator<<(const CompactInteger &compact);

    /** Appends raw bytes */
    ScaleEncodeStream &putBytes(BytesIn bytes);

    /** Returns encoded bytes */
    const Bytes &data() const;

    /** Moves out encoded bytes */
    Bytes takeData();

   private:
    Bytes data_{};
  };
}  // namespace subspace::codec::scale
