/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>
#include <tuple>

#include "codec/scale/streams_annotation.hpp"
#include "primitives/pieces/piece_error.hpp"
#include "primitives/pieces/record.hpp"

namespace subspace::primitives::pieces {
  /** Offset of commitment within a piece */
  constexpr size_t kCommitmentOffset{kRecordSize};
  /** Offset of witness within a piece */
  constexpr size_t kWitnessOffset{kCommitmentOffset + RecordCommitment::kSize};

  static_assert(kWitnessOffset + RecordWitness::kSize == kPieceSize);

  /**
   * A piece of archival history, stored in place. For heap allocated piece
   * see Piece.
   *
   * Piece consists of a record, its commitment and witness placed back to
   * back. Together with the records root of the segment the piece belongs to
   * they prove that the piece is a part of the archival history.
   */
  class PieceArray : public common::Blob<kPieceSize> {
   public:
    static constexpr size_t kSize{kPieceSize};

    using Parts =
        std::tuple<const Record &, const RecordCommitment &, const RecordWitness &>;
    using PartsMut = std::tuple<Record &, RecordCommitment &, RecordWitness &>;

    using Blob::Blob;

    /**
     * Views piece as its components, no copy is made
     * @return record, commitment and witness
     */
    Parts split() const;

    PartsMut splitMut();

    const Record &record() const;

    Record &recordMut();

    const RecordCommitment &commitment() const;

    RecordCommitment &commitmentMut();

    const RecordWitness &witness() const;

    RecordWitness &witnessMut();
  };

  SUBSPACE_ASSERT_BYTE_LAYOUT(PieceArray, kPieceSize);

  /**
   * A piece of archival history allocated on the heap. Same bytes as
   * PieceArray, moving it hands over the allocation instead of copying.
   *
   * Moved-from piece stays valid. Move construction leaves it zero filled,
   * move assignment swaps contents.
   */
  class Piece {
   public:
    /** Zero filled piece */
    Piece();

    explicit Piece(const PieceArray &array);

    Piece(const Piece &other);
    Piece(Piece &&other);
    ~Piece() = default;

    Piece &operator=(const Piece &other);
    Piece &operator=(Piece &&other) noexcept;

    /**
     * Copies bytes into a new piece
     * @param bytes - exactly kPieceSize bytes
     * @return piece or PieceError::kLengthMismatch
     */
    static outcome::result<Piece> fromSpan(BytesIn bytes);

    /**
     * Creates piece from owned bytes. Vector storage can not be adopted by a
     * fixed size array, so bytes are copied once.
     * @param bytes - exactly kPieceSize bytes
     * @return piece or PieceError::kLengthMismatch
     */
    static outcome::result<Piece> fromBytes(Bytes &&bytes);

    Bytes toBytes() const;

    const PieceArray &array() const;

    PieceArray &arrayMut();

    const PieceArray &operator*() const;

    const PieceArray *operator->() const;

    BytesIn bytes() const;

    BytesOut bytesMut();

   private:
    explicit Piece(std::unique_ptr<PieceArray> array);

    friend SCALE_DECODE(Piece);

    std::unique_ptr<PieceArray> array_;
  };

  bool operator==(const Piece &lhs, const Piece &rhs);
  SUBSPACE_OPERATOR_NOT_EQUAL(Piece)
  bool operator<(const Piece &lhs, const Piece &rhs);

  size_t hash_value(const PieceArray &array);
  size_t hash_value(const Piece &piece);

  /** Encodes exactly kPieceSize raw bytes */
  SCALE_ENCODE(PieceArray);
  /** Decodes exactly kPieceSize raw bytes in place */
  SCALE_DECODE(PieceArray);

  /** Encodes exactly kPieceSize raw bytes */
  SCALE_ENCODE(Piece);
  /**
   * Decodes piece directly into a new heap allocation, piece sized value is
   * never placed on the stack. Raises PieceError::kDecodeTruncated when input
   * is shorter than kPieceSize, piece is left untouched in that case.
   */
  SCALE_DECODE(Piece);
}  // namespace subspace::primitives::pieces

namespace std {
  template <>
  struct hash<subspace::primitives::pieces::PieceArray> {
    size_t operator()(
        const subspace::primitives::pieces::PieceArray &array) const;
  };

  template <>
  struct hash<subspace::primitives::pieces::Piece> {
    size_t operator()(const subspace::primitives::pieces::Piece &piece) const;
  };
}  // namespace std
