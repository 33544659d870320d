/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string_view>

namespace edkey::crypto {
  /**
   * Algorithms a decoded public key may carry. Only Ed25519 keys are
   * accepted by the codec, the rest are recognized to report what was found.
   */
  enum class KeyType {
    UNSPECIFIED = 100,
    RSA = 0,
    Ed25519 = 1,
    Secp256k1 = 2,
    ECDSA = 3,
    X25519 = 4,
    Ed448 = 5,
    UNKNOWN = 99,  ///< algorithm OpenSSL knows but we do not name
  };

  constexpr std::string_view toString(KeyType type) {
    switch (type) {
      case KeyType::RSA:
        return "RSA";
      case KeyType::Ed25519:
        return "Ed25519";
      case KeyType::Secp256k1:
        return "Secp256k1";
      case KeyType::ECDSA:
        return "ECDSA";
      case KeyType::X25519:
        return "X25519";
      case KeyType::Ed448:
        return "Ed448";
      case KeyType::UNKNOWN:
        return "unknown";
      case KeyType::UNSPECIFIED:
        break;
    }
    return "unspecified";
  }
}  // namespace edkey::crypto
