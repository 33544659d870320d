/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/codec/base64.hpp>

#include <array>

#include <edkey/codec/base_error.hpp>

namespace {

  const std::string_view alphabet{
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/"};

  constexpr std::array<signed char, 256> inverse_table{
      // clang-format off
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, //   0-15
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, //  16-31
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, 62, -1, -1, -1, 63, //  32-47
      52, 53, 54, 55, 56, 57, 58, 59, 60, 61, -1, -1, -1, -1, -1, -1, //  48-63
      -1,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14, //  64-79
      15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, -1, -1, -1, -1, -1, //  80-95
      -1, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40, //  96-111
      41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, -1, -1, -1, -1, -1, // 112-127
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 128-143
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 144-159
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 160-175
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 176-191
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 192-207
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 208-223
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, // 224-239
      -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1, -1  // 240-255
      // clang-format on
  };

  /// Returns max bytes needed to decode a base64 string
  constexpr std::size_t decodedSize(std::size_t n) {
    return n / 4 * 3;  // requires n&3==0
  }

  constexpr size_t kMaxPadding = 2;

  /// -1 for symbols out of the alphabet, '=' included
  signed char sextet(char c) {
    return inverse_table[static_cast<unsigned char>(c)];
  }

}  // namespace

namespace edkey::codec {

  std::string encodeBase64(BytesIn bytes) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    size_t pos = 0;
    for (auto n = bytes.size() / 3; n--; pos += 3) {  // NOLINT
      uint32_t triple = (bytes[pos] << 16u) | (bytes[pos + 1] << 8u)
                      | bytes[pos + 2];
      out += alphabet[(triple >> 18u) & 0x3fu];
      out += alphabet[(triple >> 12u) & 0x3fu];
      out += alphabet[(triple >> 6u) & 0x3fu];
      out += alphabet[triple & 0x3fu];
    }

    switch (bytes.size() % 3) {
      case 2: {
        uint32_t pair = (bytes[pos] << 8u) | bytes[pos + 1];
        out += alphabet[(pair >> 10u) & 0x3fu];
        out += alphabet[(pair >> 4u) & 0x3fu];
        out += alphabet[(pair << 2u) & 0x3fu];
        out += '=';
        break;
      }
      case 1:
        out += alphabet[(bytes[pos] >> 2u) & 0x3fu];
        out += alphabet[(bytes[pos] << 4u) & 0x3fu];
        out += "==";
        break;
      default:
        break;
    }

    return out;
  }

  outcome::result<Bytes> decodeBase64(std::string_view string) {
    if (string.size() % 4 != 0) {
      return BaseError::INVALID_BASE64_LENGTH;
    }

    size_t padding = 0;
    while (padding < string.size()
           && string[string.size() - padding - 1] == '=') {
      ++padding;
    }
    if (padding > kMaxPadding) {
      return BaseError::INVALID_BASE64_INPUT;
    }

    Bytes out;
    out.reserve(decodedSize(string.size()));

    uint32_t buffer = 0;
    size_t bits = 0;
    for (auto c : string.substr(0, string.size() - padding)) {
      auto value = sextet(c);
      if (value < 0) {
        return BaseError::INVALID_BASE64_INPUT;
      }
      buffer = (buffer << 6u) | static_cast<uint8_t>(value);
      bits += 6;
      if (bits >= 8) {
        bits -= 8;
        out.push_back(static_cast<uint8_t>((buffer >> bits) & 0xffu));
      }
    }

    return out;
  }

}  // namespace edkey::codec
