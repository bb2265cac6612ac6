/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tools/pieces/inspect.hpp"

#include <algorithm>
#include <iterator>

#include "codec/scale/scale.hpp"
#include "common/file.hpp"
#include "tools/pieces/tool_error.hpp"

namespace subspace::tools::pieces {
  using primitives::pieces::kPieceSize;
  using primitives::pieces::Piece;
  using primitives::pieces::PieceArray;

  namespace {
    outcome::result<FlatPieces> loadRaw(BytesIn input, bool flat) {
      if (!flat) {
        OUTCOME_TRY(piece, Piece::fromSpan(input));
        return FlatPieces{piece.array()};
      }
      const auto size{static_cast<size_t>(input.size())};
      if (size % kPieceSize != 0) {
        return ToolError::kInputSizeNotMultiple;
      }
      FlatPieces pieces{size / kPieceSize};
      std::copy(input.begin(), input.end(), pieces.bytesMut().begin());
      return std::move(pieces);
    }

    outcome::result<FlatPieces> loadScale(BytesIn input, bool flat) {
      if (!flat) {
        OUTCOME_TRY(piece, codec::scale::decode<Piece>(input));
        return FlatPieces{piece.array()};
      }
      FlatPieces pieces;
      OUTCOME_TRY(codec::scale::decodeInto(input, pieces));
      return std::move(pieces);
    }
  }  // namespace

  std::string toString(PieceKind kind) {
    switch (kind) {
      case PieceKind::kSource:
        return "source";
      case PieceKind::kParity:
        return "parity";
    }
    return "unknown";
  }

  outcome::result<FlatPieces> loadPieces(BytesIn input,
                                         InputFormat format,
                                         bool flat) {
    switch (format) {
      case InputFormat::kRaw:
        return loadRaw(input, flat);
      case InputFormat::kScale:
        return loadScale(input, flat);
    }
    return ToolError::kUnknownFormat;
  }

  std::vector<PieceSummary> summarize(const FlatPieces &pieces) {
    std::vector<PieceSummary> summaries;
    summaries.reserve(pieces.size());
    for (size_t i{0}; i < pieces.size(); ++i) {
      const auto &[record, commitment, witness]{pieces[i].split()};
      const auto chunks{record.fullScalarArrays()};
      summaries.push_back({
          i,
          i % 2 == 0 ? PieceKind::kSource : PieceKind::kParity,
          commitment.toHex(),
          witness.toHex(),
          static_cast<size_t>(std::distance(chunks.begin(), chunks.end())),
      });
    }
    return summaries;
  }

  outcome::result<void> writePieces(const FlatPieces &pieces,
                                    const boost::filesystem::path &dir) {
    for (size_t i{0}; i < pieces.size(); ++i) {
      const auto kind{i % 2 == 0 ? PieceKind::kSource : PieceKind::kParity};
      const auto name{toString(kind) + "-" + std::to_string(i / 2) + ".piece"};
      OUTCOME_TRY(common::writeFile(
          dir / name, gsl::make_span(pieces[i].data(), kPieceSize)));
    }
    return outcome::success();
  }
}  // namespace subspace::tools::pieces
