/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "primitives/pieces/piece.hpp"

namespace subspace::primitives::pieces {
  /**
   * Flat representation of multiple pieces concatenated for more efficient
   * processing, mostly by erasure coding.
   *
   * Pieces at even indices are source pieces, pieces at odd indices are
   * parity pieces.
   */
  class FlatPieces {
   public:
    using SourcePieces = common::StrideSpan<const PieceArray>;
    using SourcePiecesMut = common::StrideSpan<PieceArray>;
    using ParityPieces = SourcePieces;
    using ParityPiecesMut = SourcePiecesMut;

    FlatPieces() = default;

    /**
     * Allocates `count` zero filled pieces
     */
    explicit FlatPieces(size_t count);

    /**
     * Single piece collection, copy of `piece`
     */
    explicit FlatPieces(const PieceArray &piece);

    size_t size() const;

    bool empty() const;

    const PieceArray &operator[](size_t index) const;

    PieceArray &operator[](size_t index);

    std::vector<PieceArray>::const_iterator begin() const;

    std::vector<PieceArray>::const_iterator end() const;

    std::vector<PieceArray>::iterator begin();

    std::vector<PieceArray>::iterator end();

    /** Pieces at even indices, ceil(size / 2) of them */
    SourcePieces source() const;

    SourcePiecesMut sourceMut();

    /** Pieces at odd indices, floor(size / 2) of them */
    ParityPieces parity() const;

    ParityPiecesMut parityMut();

    /** All pieces as contiguous bytes, size() * kPieceSize of them */
    BytesIn bytes() const;

    BytesOut bytesMut();

    /** Releases underlying pieces */
    std::vector<PieceArray> intoInner() &&;

    bool operator==(const FlatPieces &other) const;

   private:
    std::vector<PieceArray> pieces_;
  };

  SUBSPACE_OPERATOR_NOT_EQUAL(FlatPieces)

  /** Compact piece count followed by raw pieces */
  SCALE_ENCODE(FlatPieces);
  SCALE_DECODE(FlatPieces);
}  // namespace subspace::primitives::pieces
