/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/filesystem/path.hpp>
#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "common/outcome.hpp"

namespace subspace::tools::pieces {
  /** Encoding of the input file */
  enum class InputFormat {
    /** Pieces concatenated without any framing */
    kRaw,
    /** SCALE encoded Piece or FlatPieces */
    kScale,
  };

  /**
   * @param name - "raw" or "scale"
   * @return format or ToolError::kUnknownFormat
   */
  outcome::result<InputFormat> parseInputFormat(const std::string &name);

  spdlog::level::level_enum getLogLevel(char level);

  struct Config {
    boost::filesystem::path input;
    InputFormat format{InputFormat::kRaw};
    /** Input is a batch of pieces rather than one piece */
    bool flat{false};
    /** Where to write pieces of the batch, nothing is written if not set */
    boost::optional<boost::filesystem::path> output_dir;
    spdlog::level::level_enum log_level{spdlog::level::info};

    /**
     * Reads command line, then config file given with --config.
     * Throws boost::program_options::error on invalid options.
     */
    static Config read(int argc, const char *const argv[]);
  };
}  // namespace subspace::tools::pieces
