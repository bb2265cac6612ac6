/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <array>

#include "primitives/pieces/record.hpp"

namespace subspace::primitives::pieces {
  /**
   * 128 source records and 128 parity records (as a result of erasure
   * coding) make one segment worth of pieces.
   */
  constexpr size_t kPiecesInSegment{256};

  static_assert(kPiecesInSegment % 2 == 0);

  /**
   * Raw record contained within recorded history segment before archiving is
   * applied. Holds safe bytes of every scalar of the future record.
   */
  class RawRecord
      : public common::Blob<Record::kNumScalars * crypto::scalar::kSafeBytes> {
   public:
    static constexpr size_t kSize{Record::kNumScalars
                                  * crypto::scalar::kSafeBytes};
    static constexpr size_t kNumChunks{kSize / crypto::scalar::kSafeBytes};

    using Chunks = common::StrideSpan<const SafeScalarBytes>;
    using ChunksMut = common::StrideSpan<SafeScalarBytes>;

    using Blob::Blob;

    /** Safe scalar sized chunks of the raw record */
    Chunks chunks() const {
      return {data(), kNumChunks, crypto::scalar::kSafeBytes};
    }

    ChunksMut chunksMut() {
      return {data(), kNumChunks, crypto::scalar::kSafeBytes};
    }
  };

  static_assert(RawRecord::kSize > 0);
  static_assert(RawRecord::kSize % crypto::scalar::kSafeBytes == 0,
                "raw record must be divisible into safe scalar chunks");
  SUBSPACE_ASSERT_BYTE_LAYOUT(RawRecord, RawRecord::kSize);

  /**
   * Recorded history segment includes only source records, which are later
   * erasure coded and together with commitments and witnesses become
   * kPiecesInSegment pieces of archival history.
   */
  constexpr size_t kRecordedHistorySegmentSize{RawRecord::kSize
                                               * kPiecesInSegment / 2};

  /**
   * Recorded history segment before archiving is applied.
   *
   * Note: ~3.7MiB value, allocate on the heap.
   */
  class RecordedHistorySegment
      : public std::array<RawRecord, kPiecesInSegment / 2> {
   public:
    static constexpr size_t kSize{kRecordedHistorySegmentSize};
    /** Number of raw records in one segment of recorded history */
    static constexpr size_t kRawRecords{kSize / RawRecord::kSize};

    gsl::span<const RawRecord> rawRecords() const {
      return gsl::make_span(data(), kRawRecords);
    }

    gsl::span<RawRecord> rawRecordsMut() {
      return gsl::make_span(data(), kRawRecords);
    }

    /** Whole segment as contiguous bytes */
    BytesIn bytes() const {
      return common::layout::bytesOf(rawRecords());
    }

    BytesOut bytesMut() {
      return common::layout::bytesOf(rawRecordsMut());
    }
  };

  static_assert(RecordedHistorySegment::kRawRecords == kPiecesInSegment / 2);
  SUBSPACE_ASSERT_BYTE_LAYOUT(RecordedHistorySegment,
                              RecordedHistorySegment::kSize);
}  // namespace subspace::primitives::pieces
