/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <algorithm>
#include <array>
#include <string>
#include <string_view>

#include "common/bytes.hpp"
#include "common/hexutil.hpp"
#include "common/outcome.hpp"

namespace subspace::common {
  /**
   * Error codes for exceptions that may occur during blob initialization
   */
  enum class BlobError { kIncorrectLength = 1 };
}  // namespace subspace::common

OUTCOME_HPP_DECLARE_ERROR(subspace::common, BlobError);

namespace subspace::common {
  /**
   * Base type which represents blob of fixed size.
   *
   * Holds exactly size_ bytes and nothing else, so a reference to a blob may
   * be formed over any size_ bytes of memory (see common/layout.hpp).
   */
  template <size_t size_>
  class Blob : public std::array<uint8_t, size_> {
   public:
    /**
     * Initialize blob value
     */
    Blob() {
      this->fill(0);
    }

    /**
     * @brief constructor enabling initializer list
     * @param l initializer list
     */
    explicit Blob(const std::array<uint8_t, size_> &l) {
      std::copy(l.begin(), l.end(), this->begin());
    }

    /**
     * In compile-time returns size of current blob.
     */
    static constexpr size_t size() {
      return size_;
    }

    /**
     * Converts current blob to hex string.
     */
    std::string toHex() const {
      return hex_lower(gsl::make_span(this->data(), size_));
    }

    /**
     * Create Blob from arbitrary string, putting its bytes into the blob
     * @param data arbitrary string containing
     * @return result containing Blob object if string has proper size
     */
    static outcome::result<Blob<size_>> fromString(std::string_view data) {
      if (data.size() != size_) {
        return BlobError::kIncorrectLength;
      }

      Blob<size_> b;
      std::copy(data.begin(), data.end(), b.begin());

      return b;
    }

    /**
     * Create Blob from hex string
     * @param hex hex string
     * @return result containing Blob object if hex string has proper size and
     * is in hex format
     */
    static outcome::result<Blob<size_>> fromHex(std::string_view hex) {
      OUTCOME_TRY(res, unhex(hex));
      return fromSpan(res);
    }

    /**
     * Create Blob from span of uint8_t
     * @param span
     * @return
     */
    static outcome::result<Blob<size_>> fromSpan(BytesIn span) {
      if (static_cast<size_t>(span.size()) != size_) {
        return BlobError::kIncorrectLength;
      }

      Blob<size_> blob;
      std::copy(span.begin(), span.end(), blob.begin());
      return blob;
    }
  };

  using Hash256 = Blob<32>;
}  // namespace subspace::common
