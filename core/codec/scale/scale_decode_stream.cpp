/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "codec/scale/scale_decode_stream.hpp"

#include <algorithm>

namespace subspace::codec::scale {
  ScaleDecodeStream::ScaleDecodeStream(BytesIn data) : input_{data} {}

  ScaleDecodeStream &ScaleDecodeStream::operator>>(Bytes &bytes) {
    const auto size{readLength()};
    bytes.resize(size);
    readInto(bytes);
    return *this;
  }

  ScaleDecodeStream &ScaleDecodeStream::operator>>(CompactInteger &compact) {
    uint8_t first{};
    *this >> first;
    switch (first & 0b11) {
      case 0b00:
        compact.value = first >> 2;
        return *this;
      case 0b01: {
        uint8_t second{};
        *this >> second;
        compact.value = ((static_cast<uint64_t>(second) << 8) | first) >> 2;
        if (compact.value < kCompactSingleByteLimit) {
          raiseUnexpectedValue();
        }
        return *this;
      }
      case 0b10: {
        BytesN<3> rest{};
        readInto(rest);
        compact.value = (static_cast<uint64_t>(rest[2]) << 24
                         | static_cast<uint64_t>(rest[1]) << 16
                         | static_cast<uint64_t>(rest[0]) << 8 | first)
                        >> 2;
        if (compact.value < kCompactTwoByteLimit) {
          raiseUnexpectedValue();
        }
        return *this;
      }
      default:
        break;
    }
    const size_t length = (first >> 2) + 4;
    if (length > sizeof(uint64_t)) {
      outcome::raise(ScaleDecodeError::kCompactOverflow);
    }
    BytesN<sizeof(uint64_t)> bytes{};
    readInto(gsl::make_span(bytes.data(), length));
    // highest byte must be used, otherwise shorter encoding exists
    if (bytes[length - 1] == 0) {
      raiseUnexpectedValue();
    }
    compact.value = boost::endian::
        endian_load<uint64_t, sizeof(uint64_t), boost::endian::order::little>(
            bytes.data());
    if (compact.value < kCompactFourByteLimit) {
      raiseUnexpectedValue();
    }
    return *this;
  }

  void ScaleDecodeStream::readInto(BytesOut out) {
    const auto size{static_cast<size_t>(out.size())};
    if (!hasMore(size)) {
      outcome::raise(ScaleDecodeError::kNotEnoughData);
    }
    std::copy_n(input_.begin(), size, out.begin());
    input_ = input_.subspan(size);
  }

  size_t ScaleDecodeStream::readLength() {
    CompactInteger length;
    *this >> length;
    if (length.value > remaining()) {
      outcome::raise(ScaleDecodeError::kTooManyItems);
    }
    return length.value;
  }

  size_t ScaleDecodeStream::remaining() const {
    return static_cast<size_t>(input_.size());
  }

  bool ScaleDecodeStream::hasMore(size_t n) const {
    return remaining() >= n;
  }

  bool ScaleDecodeStream::readBool() {
    uint8_t byte{};
    *this >> byte;
    if (byte > 1) {
      raiseUnexpectedValue();
    }
    return byte == 1;
  }

  void ScaleDecodeStream::raiseUnexpectedValue() {
    outcome::raise(ScaleDecodeError::kUnexpectedValue);
  }
}  // namespace subspace::codec::scale
