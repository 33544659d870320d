/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <utility>

namespace edkey::common {

  /**
   * Runs the stored callable when leaving the scope. Used to release raw
   * OpenSSL allocations which are not owned by a smart pointer.
   */
  template <typename F>
  struct FinalAction {
    FinalAction() = delete;
    FinalAction(FinalAction &&func) = delete;
    FinalAction(const FinalAction &func) = delete;
    FinalAction &operator=(FinalAction &&func) = delete;
    FinalAction &operator=(const FinalAction &func) = delete;

    FinalAction(F &&func) : func(std::forward<F>(func)) {}

    ~FinalAction() {
      func();
    }

   public:
    // To prevent an object being created on the heap
    void *operator new(std::size_t) = delete;            // standard new
    void *operator new(std::size_t, void *) = delete;    // placement new
    void *operator new[](std::size_t) = delete;          // array new
    void *operator new[](std::size_t, void *) = delete;  // placement array new

   private:
    F func;
  };

  template <typename F>
  FinalAction(F &&) -> FinalAction<F>;

}  // namespace edkey::common
