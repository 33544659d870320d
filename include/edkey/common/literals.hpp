/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef EDKEY_LITERALS_HPP
#define EDKEY_LITERALS_HPP

#include <cstdint>
#include <vector>

#include <edkey/common/types.hpp>

namespace edkey::common {

  std::vector<uint8_t> operator""_v(const char *c, std::size_t s);

  /// Throws if the literal is not valid hex, meant for constants
  std::vector<uint8_t> operator""_unhex(const char *c, std::size_t s);

}  // namespace edkey::common

#endif  // EDKEY_LITERALS_HPP
