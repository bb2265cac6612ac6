/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/scale/scale_encode_stream.hpp"

namespace subspace::codec::scale {
  ScaleEncodeStream &ScaleEncodeStream::operator<<(const Bytes &bytes) {
    *this << CompactInteger{bytes.size()};
    return putBytes(bytes);
  }

  ScaleEncodeStream &ScaleEncodeStream::operator<<(
      const CompactInteger &compact) {
    const auto value{compact.value};
    if (value < kCompactSingleByteLimit) {
      return *this << static_cast<uint8_t>(value << 2);
    }
    if (value < kCompactTwoByteLimit) {
      return *this << static_cast<uint16_t>((value << 2) | 0b01);
    }
    if (value < kCompactFourByteLimit) {
      return *this << static_cast<uint32_t>((value << 2) | 0b10);
    }
    size_t length{0};
    for (auto rest{value}; rest != 0; rest >>= 8) {
      ++length;
    }
    data_.push_back(static_cast<uint8_t>(((length - 4) << 2) | 0b11));
    for (size_t i{0}; i < length; ++i) {
      data_.push_back(static_cast<uint8_t>(value >> (8 * i)));
    }
    return *this;
  }

  ScaleEncodeStream &ScaleEncodeStream::putBytes(BytesIn bytes) {
    append(data_, bytes);
    return *this;
  }

  const Bytes &ScaleEncodeStream::data() const {
    return data_;
  }

  Bytes ScaleEncodeStream::takeData() {
    return std::move(data_);
  }
}  // namespace subspace::codec::scale
