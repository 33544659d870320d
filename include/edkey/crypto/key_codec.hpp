/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>
#include <string_view>

#include <edkey/crypto/error.hpp>
#include <edkey/crypto/public_key.hpp>
#include <edkey/outcome/outcome.hpp>

namespace edkey::crypto {

  /**
   * @class Converts Ed25519 public keys to base64 text of their X.509
   * SubjectPublicKeyInfo encoding and back. Failures are KeyCodecError codes
   */
  class KeyCodec {
   public:
    virtual ~KeyCodec() = default;

    /**
     * @brief render key as base64 of its DER encoding, without armor and
     * without line breaks
     * @param key - Ed25519 public key
     * @return text or ALGORITHM_MISMATCH if key is not an Ed25519 key
     */
    virtual outcome::result<std::string> keyToString(
        const PublicKey &key) const = 0;

    /**
     * @brief same as keyToString, wrapped into PEM "PUBLIC KEY" armor
     * @param key - Ed25519 public key
     * @return armored text or ALGORITHM_MISMATCH
     */
    virtual outcome::result<std::string> keyToPem(
        const PublicKey &key) const = 0;

    /**
     * @brief parse base64 text, optionally PEM armored, into a key
     * @param text - encoded key
     * @return Ed25519 public key, MALFORMED_BASE64, MALFORMED_KEY_ENCODING or
     * ALGORITHM_MISMATCH
     */
    virtual outcome::result<PublicKey> stringToKey(
        std::string_view text) const = 0;
  };

}  // namespace edkey::crypto
