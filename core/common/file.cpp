/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "common/file.hpp"

#include <boost/filesystem/operations.hpp>
#include <fstream>

#include "common/span.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(subspace::common, FileError, e) {
  using subspace::common::FileError;
  switch (e) {
    case FileError::kCannotOpen:
      return "File: cannot open file";
    case FileError::kReadFailed:
      return "File: read failed";
    case FileError::kWriteFailed:
      return "File: write failed";
    default:
      return "File: unknown error";
  }
}

namespace subspace::common {
  outcome::result<Bytes> readFile(const boost::filesystem::path &path) {
    std::ifstream file{path.c_str(), std::ios::binary | std::ios::ate};
    if (!file.good()) {
      return FileError::kCannotOpen;
    }
    Bytes result;
    result.resize(static_cast<size_t>(file.tellg()));
    file.seekg(0, std::ios::beg);
    if (!file.read(span::string(result).data(),
                   static_cast<std::streamsize>(result.size()))
             .good()
        && !result.empty()) {
      return FileError::kReadFailed;
    }
    return result;
  }

  outcome::result<void> writeFile(const boost::filesystem::path &path,
                                  BytesIn input) {
    if (path.has_parent_path()) {
      boost::filesystem::create_directories(path.parent_path());
    }
    std::ofstream file{path.c_str(), std::ios::binary};
    if (!file.good()) {
      return FileError::kCannotOpen;
    }
    if (file.write(span::bytestr(input.data()),
                   static_cast<std::streamsize>(input.size()))
            .good()) {
      return outcome::success();
    }
    return FileError::kWriteFailed;
  }
}  // namespace subspace::common
