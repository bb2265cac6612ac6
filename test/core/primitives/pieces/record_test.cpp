/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "primitives/pieces/record.hpp"

#include <gtest/gtest.h>
#include <memory>

using subspace::crypto::scalar::kFullBytes;
using subspace::crypto::scalar::kSafeBytes;
using subspace::primitives::pieces::kPieceSize;
using subspace::primitives::pieces::kRecordSize;
using subspace::primitives::pieces::Record;
using subspace::primitives::pieces::RecordCommitment;
using subspace::primitives::pieces::RecordWitness;

TEST(RecordTest, Sizes) {
  EXPECT_EQ(kPieceSize, 31744);
  EXPECT_EQ(RecordCommitment::kSize, 48);
  EXPECT_EQ(RecordWitness::kSize, 48);
  EXPECT_EQ(kRecordSize, 31648);
  EXPECT_EQ(Record::kNumScalars, 989);
  EXPECT_EQ(sizeof(Record), kRecordSize);
}

/**
 * @given record where each scalar chunk is filled with its index
 * @when viewing record as full scalar chunks
 * @then chunks cover whole record in order and point into record memory
 */
TEST(RecordTest, FullScalarArrays) {
  auto record{std::make_unique<Record>()};
  for (size_t i{0}; i < kRecordSize; ++i) {
    (*record)[i] = static_cast<uint8_t>(i / kFullBytes);
  }
  const auto &view{*record};
  const auto chunks{view.fullScalarArrays()};
  ASSERT_EQ(chunks.size(), Record::kNumScalars);
  size_t index{0};
  for (const auto &chunk : chunks) {
    for (auto byte : chunk) {
      EXPECT_EQ(byte, static_cast<uint8_t>(index));
    }
    ++index;
  }
  EXPECT_EQ(index, Record::kNumScalars);
  EXPECT_EQ(chunks.front().data(), record->data());
  EXPECT_EQ(chunks.back().data() + kFullBytes, record->data() + kRecordSize);
}

/**
 * @given zero record
 * @when writing through safe scalar chunks
 * @then first 31 bytes of each scalar are written, last byte stays zero
 */
TEST(RecordTest, SafeScalarArraysMut) {
  auto record{std::make_unique<Record>()};
  auto chunks{record->safeScalarArraysMut()};
  ASSERT_EQ(chunks.size(), Record::kNumScalars);
  for (auto &chunk : chunks) {
    chunk.fill(0xff);
  }
  for (size_t i{0}; i < kRecordSize; ++i) {
    EXPECT_EQ((*record)[i], i % kFullBytes < kSafeBytes ? 0xff : 0) << i;
  }
  const auto &view{*record};
  EXPECT_EQ(view.safeScalarArrays().size(), Record::kNumScalars);
  EXPECT_EQ(view.safeScalarArrays()[1].data(), record->data() + kFullBytes);
}

TEST(RecordTest, FullScalarArraysMut) {
  auto record{std::make_unique<Record>()};
  record->fullScalarArraysMut()[988].fill(1);
  EXPECT_EQ((*record)[kRecordSize - kFullBytes - 1], 0);
  EXPECT_EQ((*record)[kRecordSize - kFullBytes], 1);
  EXPECT_EQ((*record)[kRecordSize - 1], 1);
}
