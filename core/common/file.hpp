/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/filesystem/path.hpp>

#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace subspace::common {
  enum class FileError {
    kCannotOpen = 1,
    kReadFailed,
    kWriteFailed,
  };

  /**
   * Reads whole file
   * @param path - file to read
   * @return file content
   */
  outcome::result<Bytes> readFile(const boost::filesystem::path &path);

  /**
   * Writes bytes to file, creating parent directories, replacing existing file
   * @param path - file to write
   * @param input - content
   */
  outcome::result<void> writeFile(const boost::filesystem::path &path,
                                  BytesIn input);
}  // namespace subspace::common

OUTCOME_HPP_DECLARE_ERROR(subspace::common, FileError);
