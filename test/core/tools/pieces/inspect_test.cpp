/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tools/pieces/inspect.hpp"

#include <gtest/gtest.h>
#include <boost/filesystem.hpp>

#include "codec/scale/scale.hpp"
#include "common/file.hpp"
#include "testutil/outcome.hpp"
#include "tools/pieces/tool_error.hpp"

using subspace::Bytes;
using subspace::codec::scale::encode;
using subspace::common::readFile;
using subspace::primitives::pieces::kCommitmentOffset;
using subspace::primitives::pieces::kPieceSize;
using subspace::primitives::pieces::kWitnessOffset;
using subspace::primitives::pieces::Piece;
using subspace::primitives::pieces::PieceError;
using subspace::tools::pieces::FlatPieces;
using subspace::tools::pieces::InputFormat;
using subspace::tools::pieces::loadPieces;
using subspace::tools::pieces::PieceKind;
using subspace::tools::pieces::summarize;
using subspace::tools::pieces::ToolError;
using subspace::tools::pieces::writePieces;

class InspectTest : public ::testing::Test {
 public:
  void SetUp() override {
    pieces = FlatPieces{3};
    for (size_t i{0}; i < pieces.size(); ++i) {
      pieces[i].commitmentMut()[0] = static_cast<uint8_t>(0x10 + i);
      pieces[i].witnessMut()[47] = static_cast<uint8_t>(0x20 + i);
    }
    raw = subspace::copy(pieces.bytes());
  }

  FlatPieces pieces;
  Bytes raw;
};

/**
 * @given concatenated pieces
 * @when loading them as flat raw input
 * @then same pieces are loaded
 */
TEST_F(InspectTest, LoadRawFlat) {
  EXPECT_OUTCOME_EQ(loadPieces(raw, InputFormat::kRaw, true), pieces);
}

TEST_F(InspectTest, LoadRawSingle) {
  const Bytes single(raw.begin(), raw.begin() + kPieceSize);
  EXPECT_OUTCOME_TRUE(loaded, loadPieces(single, InputFormat::kRaw, false));
  ASSERT_EQ(loaded.size(), 1);
  EXPECT_EQ(loaded[0], pieces[0]);
}

/**
 * @given input which is not a whole number of pieces
 * @when loading it
 * @then corresponding error is returned
 */
TEST_F(InspectTest, LoadRawWrongSize) {
  raw.pop_back();
  EXPECT_OUTCOME_ERROR(ToolError::kInputSizeNotMultiple,
                       loadPieces(raw, InputFormat::kRaw, true));
  EXPECT_OUTCOME_ERROR(PieceError::kLengthMismatch,
                       loadPieces(raw, InputFormat::kRaw, false));
}

TEST_F(InspectTest, LoadScale) {
  EXPECT_OUTCOME_TRUE(encoded, encode(pieces));
  EXPECT_OUTCOME_EQ(loadPieces(encoded, InputFormat::kScale, true), pieces);

  EXPECT_OUTCOME_TRUE(piece, Piece::fromSpan(pieces.bytes().subspan(
                                 kPieceSize, kPieceSize)));
  EXPECT_OUTCOME_TRUE(encoded_piece, encode(piece));
  EXPECT_OUTCOME_TRUE(loaded, loadPieces(encoded_piece, InputFormat::kScale, false));
  ASSERT_EQ(loaded.size(), 1);
  EXPECT_EQ(loaded[0], pieces[1]);

  EXPECT_OUTCOME_ERROR(
      PieceError::kDecodeTruncated,
      loadPieces(Bytes(kPieceSize - 1), InputFormat::kScale, false));
}

/**
 * @given three pieces
 * @when summarizing them
 * @then kinds alternate and hex of commitment and witness is reported
 */
TEST_F(InspectTest, Summarize) {
  const auto summaries{summarize(pieces)};
  ASSERT_EQ(summaries.size(), 3);
  EXPECT_EQ(summaries[0].kind, PieceKind::kSource);
  EXPECT_EQ(summaries[1].kind, PieceKind::kParity);
  EXPECT_EQ(summaries[2].kind, PieceKind::kSource);
  EXPECT_EQ(summaries[2].index, 2);
  EXPECT_EQ(summaries[1].commitment.substr(0, 4), "1100");
  EXPECT_EQ(summaries[1].commitment.size(), 96);
  EXPECT_EQ(summaries[1].witness.substr(94), "21");
  EXPECT_EQ(summaries[0].chunks, 989);
}

/**
 * @given three pieces
 * @when writing them to directory
 * @then two source files and one parity file hold raw piece bytes
 */
TEST_F(InspectTest, WritePieces) {
  const auto dir{boost::filesystem::temp_directory_path()
                 / boost::filesystem::unique_path()};
  EXPECT_OUTCOME_TRUE_1(writePieces(pieces, dir));
  EXPECT_OUTCOME_TRUE(source1, readFile(dir / "source-1.piece"));
  EXPECT_OUTCOME_TRUE(parity0, readFile(dir / "parity-0.piece"));
  boost::filesystem::remove_all(dir);
  EXPECT_EQ(source1.size(), kPieceSize);
  EXPECT_EQ(source1[kCommitmentOffset], 0x12);
  EXPECT_EQ(parity0[kWitnessOffset + 47], 0x21);
}
