/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

#include <boost/algorithm/hex.hpp>

#include <edkey/common/types.hpp>
#include <edkey/outcome/outcome.hpp>

namespace edkey::common {

  /**
   * @brief error codes for exceptions that may occur during unhexing
   */
  enum class UnhexError { NOT_ENOUGH_INPUT = 1, NON_HEX_INPUT, UNKNOWN };

  /**
   * @brief Converts bytes to hex representation
   * @param bytes to be converted
   * @return lowercase hexstring
   */
  inline std::string hex_lower(BytesIn bytes) {
    std::string res(bytes.size() * 2, '\x00');
    boost::algorithm::hex_lower(bytes.begin(), bytes.end(), res.begin());
    return res;
  }

  /**
   * @brief Converts hex representation to bytes
   * @param hex string, both uppercase and lowercase digits are accepted
   * @return result containing array of bytes if input string is hex encoded and
   * has even length
   */
  outcome::result<Bytes> unhex(std::string_view hex);

}  // namespace edkey::common

OUTCOME_HPP_DECLARE_ERROR(edkey::common, UnhexError);
