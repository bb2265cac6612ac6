/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "primitives/pieces/flat_pieces.hpp"
#include "tools/pieces/config.hpp"

namespace subspace::tools::pieces {
  using primitives::pieces::FlatPieces;

  enum class PieceKind {
    kSource,
    kParity,
  };

  std::string toString(PieceKind kind);

  /**
   * What the tool prints for one piece
   */
  struct PieceSummary {
    size_t index{};
    PieceKind kind{};
    std::string commitment;
    std::string witness;
    /** Number of full scalar chunks the record consists of */
    size_t chunks{};
  };

  /**
   * Parses input into pieces.
   * Single piece input gives a batch of one source piece.
   * @param input - file content
   * @param format - encoding of input
   * @param flat - whether input is a batch of pieces
   */
  outcome::result<FlatPieces> loadPieces(BytesIn input,
                                         InputFormat format,
                                         bool flat);

  std::vector<PieceSummary> summarize(const FlatPieces &pieces);

  /**
   * Writes each piece as raw bytes to `source-<k>.piece` or
   * `parity-<k>.piece` in dir, k is the index among pieces of the same kind
   */
  outcome::result<void> writePieces(const FlatPieces &pieces,
                                    const boost::filesystem::path &dir);
}  // namespace subspace::tools::pieces
