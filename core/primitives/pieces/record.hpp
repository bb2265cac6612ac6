/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/blob.hpp"
#include "common/layout.hpp"
#include "common/stride_span.hpp"
#include "crypto/scalar/scalar.hpp"

namespace subspace::primitives::pieces {
  using crypto::scalar::FullScalarBytes;
  using crypto::scalar::SafeScalarBytes;

  /**
   * Byte size of a piece, ~32KiB. A bit less than 32KiB since it must be a
   * multiple of 2 bytes for erasure coding and its record must be a multiple
   * of scalar size.
   * Can not be changed after the network is launched.
   */
  constexpr size_t kPieceSize{31744};

  static_assert(kPieceSize % 2 == 0);

  /**
   * Record commitment contained within a piece.
   */
  class RecordCommitment : public common::Blob<48> {
   public:
    static constexpr size_t kSize{48};

    using Blob::Blob;
  };

  /**
   * Record witness contained within a piece.
   */
  class RecordWitness : public common::Blob<48> {
   public:
    static constexpr size_t kSize{48};

    using Blob::Blob;
  };

  /**
   * Size of a record given the global piece size, multiple of scalar size.
   */
  constexpr size_t kRecordSize{kPieceSize - RecordCommitment::kSize
                               - RecordWitness::kSize};

  static_assert(kRecordSize % crypto::scalar::kFullBytes == 0,
                "record must be divisible into whole scalars");

  /**
   * Record contained within a piece.
   *
   * Note: ~31KiB value, avoid keeping it on the stack, prefer views into a
   * PieceArray.
   */
  class Record : public common::Blob<kRecordSize> {
   public:
    static constexpr size_t kSize{kRecordSize};
    /** Number of scalars the record is made of */
    static constexpr size_t kNumScalars{kSize / crypto::scalar::kFullBytes};

    using FullScalarArrays = common::StrideSpan<const FullScalarBytes>;
    using FullScalarArraysMut = common::StrideSpan<FullScalarBytes>;
    using SafeScalarArrays = common::StrideSpan<const SafeScalarBytes>;
    using SafeScalarArraysMut = common::StrideSpan<SafeScalarBytes>;

    using Blob::Blob;

    /**
     * Sequence of scalar sized chunks covering the whole record.
     */
    FullScalarArrays fullScalarArrays() const;

    FullScalarArraysMut fullScalarArraysMut();

    /**
     * Sequence of safe prefixes of the scalar sized chunks.
     *
     * Only meaningful for source records, where raw record bytes occupy safe
     * bytes of each scalar and the rest is zero padding. Record does not know
     * whether it is a source or parity one, caller does.
     */
    SafeScalarArrays safeScalarArrays() const;

    SafeScalarArraysMut safeScalarArraysMut();
  };

  SUBSPACE_ASSERT_BYTE_LAYOUT(RecordCommitment, RecordCommitment::kSize);
  SUBSPACE_ASSERT_BYTE_LAYOUT(RecordWitness, RecordWitness::kSize);
  SUBSPACE_ASSERT_BYTE_LAYOUT(Record, Record::kSize);
  SUBSPACE_ASSERT_BYTE_LAYOUT(FullScalarBytes, crypto::scalar::kFullBytes);
  SUBSPACE_ASSERT_BYTE_LAYOUT(SafeScalarBytes, crypto::scalar::kSafeBytes);
}  // namespace subspace::primitives::pieces
