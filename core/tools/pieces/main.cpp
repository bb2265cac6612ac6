/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>

#include <boost/program_options/errors.hpp>

#include "common/file.hpp"
#include "common/logger.hpp"
#include "common/outcome_fmt.hpp"
#include "tools/pieces/config.hpp"
#include "tools/pieces/inspect.hpp"

namespace subspace::tools::pieces {
  namespace {
    common::Logger log() {
      static common::Logger logger = common::createLogger("pieces_tool");
      return logger;
    }
  }  // namespace

  outcome::result<void> run(const Config &config) {
    OUTCOME_TRY(input, common::readFile(config.input));
    log()->info("read {} bytes from {}", input.size(), config.input.string());
    OUTCOME_TRY(pieces, loadPieces(input, config.format, config.flat));
    log()->info("loaded {} pieces", pieces.size());
    for (const auto &summary : summarize(pieces)) {
      fmt::print("{} {} commitment={} witness={} chunks={}\n",
                 summary.index,
                 toString(summary.kind),
                 summary.commitment,
                 summary.witness,
                 summary.chunks);
    }
    if (config.output_dir) {
      OUTCOME_TRY(writePieces(pieces, *config.output_dir));
      log()->info("written {} pieces to {}",
                  pieces.size(),
                  config.output_dir->string());
    }
    return outcome::success();
  }
}  // namespace subspace::tools::pieces

int main(int argc, char *argv[]) {
  using subspace::tools::pieces::Config;
  Config config;
  try {
    config = Config::read(argc, argv);
  } catch (const boost::program_options::error &e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }
  spdlog::set_level(config.log_level);

  if (auto res{subspace::tools::pieces::run(config)}; !res) {
    spdlog::error("pieces_tool: {:#}", res.error());
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
