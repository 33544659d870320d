/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <edkey/outcome/outcome.hpp>

namespace edkey::codec {

  enum class BaseError {
    INVALID_BASE64_INPUT = 1,  ///< symbol outside of alphabet or misplaced '='
    INVALID_BASE64_LENGTH,     ///< length is not a multiple of 4
  };

}

OUTCOME_HPP_DECLARE_ERROR(edkey::codec, BaseError);
