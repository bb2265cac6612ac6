/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/pieces/flat_pieces.hpp"

#include "codec/scale/scale_decode_stream.hpp"
#include "codec/scale/scale_encode_stream.hpp"

namespace subspace::primitives::pieces {
  namespace {
    /** Distance between two source or two parity pieces */
    constexpr size_t kInterleaveStride{2 * kPieceSize};
  }  // namespace

  FlatPieces::FlatPieces(size_t count) : pieces_(count) {}

  FlatPieces::FlatPieces(const PieceArray &piece) : pieces_(1, piece) {}

  size_t FlatPieces::size() const {
    return pieces_.size();
  }

  bool FlatPieces::empty() const {
    return pieces_.empty();
  }

  const PieceArray &FlatPieces::operator[](size_t index) const {
    BOOST_ASSERT(index < pieces_.size());
    return pieces_[index];
  }

  PieceArray &FlatPieces::operator[](size_t index) {
    BOOST_ASSERT(index < pieces_.size());
    return pieces_[index];
  }

  std::vector<PieceArray>::const_iterator FlatPieces::begin() const {
    return pieces_.begin();
  }

  std::vector<PieceArray>::const_iterator FlatPieces::end() const {
    return pieces_.end();
  }

  std::vector<PieceArray>::iterator FlatPieces::begin() {
    return pieces_.begin();
  }

  std::vector<PieceArray>::iterator FlatPieces::end() {
    return pieces_.end();
  }

  FlatPieces::SourcePieces FlatPieces::source() const {
    if (pieces_.empty()) {
      return {};
    }
    return {pieces_.front().data(), (size() + 1) / 2, kInterleaveStride};
  }

  FlatPieces::SourcePiecesMut FlatPieces::sourceMut() {
    if (pieces_.empty()) {
      return {};
    }
    return {pieces_.front().data(), (size() + 1) / 2, kInterleaveStride};
  }

  FlatPieces::ParityPieces FlatPieces::parity() const {
    if (size() < 2) {
      return {};
    }
    return {pieces_[1].data(), size() / 2, kInterleaveStride};
  }

  FlatPieces::ParityPiecesMut FlatPieces::parityMut() {
    if (size() < 2) {
      return {};
    }
    return {pieces_[1].data(), size() / 2, kInterleaveStride};
  }

  BytesIn FlatPieces::bytes() const {
    return common::layout::bytesOf(gsl::make_span(pieces_));
  }

  BytesOut FlatPieces::bytesMut() {
    return common::layout::bytesOf(gsl::make_span(pieces_));
  }

  std::vector<PieceArray> FlatPieces::intoInner() && {
    return std::move(pieces_);
  }

  bool FlatPieces::operator==(const FlatPieces &other) const {
    return pieces_ == other.pieces_;
  }

  SCALE_ENCODE(FlatPieces) {
    s << codec::scale::CompactInteger{v.size()};
    return s.putBytes(v.bytes());
  }

  SCALE_DECODE(FlatPieces) {
    codec::scale::CompactInteger count;
    s >> count;
    if (count.value > s.remaining() / kPieceSize) {
      outcome::raise(codec::scale::ScaleDecodeError::kNotEnoughData);
    }
    FlatPieces pieces{static_cast<size_t>(count.value)};
    s.readInto(pieces.bytesMut());
    v = std::move(pieces);
    return s;
  }
}  // namespace subspace::primitives::pieces
