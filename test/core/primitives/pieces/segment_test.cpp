/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/pieces/segment.hpp"

#include <gtest/gtest.h>
#include <memory>

using subspace::crypto::scalar::kSafeBytes;
using subspace::primitives::pieces::kPiecesInSegment;
using subspace::primitives::pieces::kRecordedHistorySegmentSize;
using subspace::primitives::pieces::RawRecord;
using subspace::primitives::pieces::RecordedHistorySegment;

TEST(SegmentTest, Sizes) {
  EXPECT_EQ(kPiecesInSegment, 256);
  EXPECT_EQ(RawRecord::kSize, 30659);
  EXPECT_EQ(RawRecord::kNumChunks, 989);
  EXPECT_EQ(RecordedHistorySegment::kRawRecords, 128);
  EXPECT_EQ(kRecordedHistorySegmentSize, 3924352);
  EXPECT_EQ(sizeof(RecordedHistorySegment), kRecordedHistorySegmentSize);
}

/**
 * @given raw record
 * @when writing through its safe chunks
 * @then chunks are adjacent, without gaps
 */
TEST(SegmentTest, RawRecordChunks) {
  auto record{std::make_unique<RawRecord>()};
  size_t index{0};
  for (auto &chunk : record->chunksMut()) {
    chunk.fill(static_cast<uint8_t>(index++));
  }
  EXPECT_EQ(index, RawRecord::kNumChunks);
  EXPECT_EQ((*record)[kSafeBytes - 1], 0);
  EXPECT_EQ((*record)[kSafeBytes], 1);
  const auto &view{*record};
  EXPECT_EQ(view.chunks()[988][0], static_cast<uint8_t>(988));
}

/**
 * @given segment on the heap
 * @when writing its bytes
 * @then raw records see the same memory
 */
TEST(SegmentTest, Bytes) {
  auto segment{std::make_unique<RecordedHistorySegment>()};
  auto bytes{segment->bytesMut()};
  ASSERT_EQ(static_cast<size_t>(bytes.size()), kRecordedHistorySegmentSize);
  bytes[RawRecord::kSize] = 7;
  EXPECT_EQ(segment->rawRecords()[1][0], 7);
  EXPECT_EQ(segment->rawRecords().size(), 128);
  const auto &view{*segment};
  EXPECT_EQ(view.bytes().data(), segment->front().data());
}
