/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "tools/pieces/config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "tools/pieces/tool_error.hpp"

namespace subspace::tools::pieces {
  inline void validate(boost::any &out,
                       const std::vector<std::string> &values,
                       InputFormat *,
                       long) {
    using namespace boost::program_options;
    check_first_occurrence(out);
    auto &value{get_single_string(values)};
    if (auto format{parseInputFormat(value)}) {
      out = format.value();
      return;
    }
    boost::throw_exception(invalid_option_value{value});
  }

  outcome::result<InputFormat> parseInputFormat(const std::string &name) {
    if (name == "raw") {
      return InputFormat::kRaw;
    }
    if (name == "scale") {
      return InputFormat::kScale;
    }
    return ToolError::kUnknownFormat;
  }

  spdlog::level::level_enum getLogLevel(char level) {
    switch (level) {
      case 'e':
        return spdlog::level::err;
      case 'w':
        return spdlog::level::warn;
      case 'd':
        return spdlog::level::debug;
      case 't':
        return spdlog::level::trace;
    }
    return spdlog::level::info;
  }

  Config Config::read(int argc, const char *const argv[]) {
    Config config;
    struct {
      char log_level;
      boost::optional<boost::filesystem::path> config_file;
      boost::filesystem::path output_dir;
    } raw;
    namespace po = boost::program_options;
    po::options_description desc("Pieces tool options");
    auto option{desc.add_options()};
    option("help,h", "print usage message");
    option("input,i",
           po::value(&config.input)->required(),
           "file with pieces to inspect");
    option("format,f",
           po::value(&config.format)->default_value(InputFormat::kRaw, "raw"),
           "input format, [raw,scale]");
    option("flat",
           po::bool_switch(&config.flat),
           "input is a batch of source and parity pieces");
    option("output-dir,o",
           po::value(&raw.output_dir),
           "write every piece of the batch to this directory");
    option("log,l",
           po::value(&raw.log_level)->default_value('i'),
           "log level, [e,w,i,d,t]");
    option("config", po::value(&raw.config_file), "read options from file");

    po::variables_map vm;
    po::store(po::parse_command_line(argc, argv, desc), vm);
    if (vm.count("help") != 0) {
      std::cerr << desc << std::endl;
      exit(EXIT_SUCCESS);
    }
    if (vm.count("config") != 0) {
      std::ifstream config_file{
          vm["config"].as<boost::filesystem::path>().string()};
      if (!config_file.good()) {
        boost::throw_exception(po::reading_file{
            vm["config"].as<boost::filesystem::path>().string().c_str()});
      }
      po::store(po::parse_config_file(config_file, desc), vm);
    }
    po::notify(vm);

    if (vm.count("output-dir") != 0) {
      config.output_dir = raw.output_dir;
    }
    config.log_level = getLogLevel(raw.log_level);
    return config;
  }
}  // namespace subspace::tools::pieces
