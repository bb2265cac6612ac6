/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <typeindex>
#include <type_traits>
#include <typeinfo>
#include <unordered_map>

namespace subspace::host {
  /**
   * Host extensions available to the current execution context, at most one
   * per extension type
   */
  class Externalities {
   public:
    /**
     * Registers extension under interface T, replacing previous one. T is
     * not deduced, so implementation is always looked up by its interface.
     */
    template <typename T>
    void registerExtension(std::shared_ptr<std::common_type_t<T>> extension) {
      extensions_[std::type_index{typeid(T)}] = std::move(extension);
    }

    /**
     * @return registered extension of type T or nullptr
     */
    template <typename T>
    T *extension() const {
      auto it{extensions_.find(std::type_index{typeid(T)})};
      if (it == extensions_.end()) {
        return nullptr;
      }
      return static_cast<T *>(it->second.get());
    }

   private:
    std::unordered_map<std::type_index, std::shared_ptr<void>> extensions_;
  };

  /**
   * Host was wired without an extension the runtime relies on. Logs and
   * aborts the process.
   * @param name - name of missing extension
   */
  [[noreturn]] void missingExtension(const std::string &name);
}  // namespace subspace::host
