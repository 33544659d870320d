/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/key_codec/armor.hpp>

#include <algorithm>

#include <boost/algorithm/string/erase.hpp>

namespace edkey::crypto {

  std::string stripArmor(std::string_view text) {
    std::string payload{text};
    if (payload.find(kArmorMarker) == std::string::npos) {
      return payload;
    }

    boost::algorithm::erase_all(payload, kPemHeader);
    boost::algorithm::erase_all(payload, kPemFooter);
    // "\r\n", "\n" and "\r" alike, whatever the host line terminator is
    std::erase_if(payload, [](char c) { return c == '\r' || c == '\n'; });
    return payload;
  }

  std::string armor(std::string_view base64, size_t line_width) {
    std::string out;
    out.reserve(kPemHeader.size() + kPemFooter.size() + base64.size()
                + base64.size() / std::max<size_t>(line_width, 1) + 3);

    out += kPemHeader;
    out += '\n';
    if (line_width == 0) {
      out += base64;
      out += '\n';
    } else {
      for (size_t i = 0; i < base64.size(); i += line_width) {
        out += base64.substr(i, line_width);
        out += '\n';
      }
    }
    out += kPemFooter;
    out += '\n';
    return out;
  }

}  // namespace edkey::crypto
