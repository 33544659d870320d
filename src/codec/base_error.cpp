/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/codec/base_error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(edkey::codec, BaseError, e) {
  using E = edkey::codec::BaseError;
  switch (e) {
    case E::INVALID_BASE64_INPUT:
      return "Input is not a valid base64 string";
    case E::INVALID_BASE64_LENGTH:
      return "Length of base64 input is not a multiple of 4";
    default:
      return "Unknown error";
  }
}
