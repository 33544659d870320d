/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

namespace edkey::crypto {

  constexpr std::string_view kPemHeader = "-----BEGIN PUBLIC KEY-----";
  constexpr std::string_view kPemFooter = "-----END PUBLIC KEY-----";

  /// Text containing this is considered armored
  constexpr std::string_view kArmorMarker = "----BEGIN";

  /**
   * @brief remove PEM armor from encoded key text. If the text contains
   * kArmorMarker, every kPemHeader, every kPemFooter and every line break
   * ("\r\n", "\n" or "\r") is removed; otherwise the text is returned as is
   * @param text - possibly armored base64
   * @return base64 payload
   */
  std::string stripArmor(std::string_view text);

  /**
   * @brief wrap base64 payload into kPemHeader / kPemFooter lines
   * @param base64 - payload
   * @param line_width - payload symbols per line, 0 for a single line
   * @return armored text, every line terminated with "\n"
   */
  std::string armor(std::string_view base64, size_t line_width);

}  // namespace edkey::crypto
