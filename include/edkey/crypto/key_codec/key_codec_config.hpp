/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstddef>

namespace edkey::crypto {

  struct KeyCodecConfig {
    /// Base64 symbols per line of PEM output, 0 puts the payload on one line
    size_t pem_line_width = 64;
  };

}  // namespace edkey::crypto
