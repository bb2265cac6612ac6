/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "host/externalities.hpp"

#include <cstdlib>

#include "common/logger.hpp"

namespace subspace::host {
  void missingExtension(const std::string &name) {
    static const auto logger{common::createLogger("host")};
    logger->critical("No `{}` associated for the current context!", name);
    logger->flush();
    std::abort();
  }
}  // namespace subspace::host
