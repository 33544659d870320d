/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <edkey/common/types.hpp>
#include <edkey/outcome/outcome.hpp>

/**
 * Encode/decode to/from base64 format (RFC 4648 standard alphabet, padded)
 */
namespace edkey::codec {

  /**
   * Encode bytes to base64 string, no line breaks are inserted
   * @param bytes to be encoded
   * @return encoded string
   */
  std::string encodeBase64(BytesIn bytes);

  /**
   * Decode base64 string to bytes. Input must consist of the alphabet symbols
   * only, optionally followed by up to two '=' padding symbols, and have a
   * length multiple of 4
   * @param string to be decoded
   * @return decoded bytes in case of success
   */
  outcome::result<Bytes> decodeBase64(std::string_view string);

}  // namespace edkey::codec
