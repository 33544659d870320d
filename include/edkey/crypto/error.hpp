/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef EDKEY_CRYPTO_ERROR_HPP
#define EDKEY_CRYPTO_ERROR_HPP

#include <edkey/outcome/outcome.hpp>

namespace edkey::crypto {
  /**
   * Failures reported by the key codec to its callers
   */
  enum class KeyCodecError {
    ALGORITHM_MISMATCH = 1,  ///< key is not an Ed25519 key
    MALFORMED_BASE64,        ///< text is not valid base64
    MALFORMED_KEY_ENCODING,  ///< bytes are not an Ed25519 SubjectPublicKeyInfo
  };

  enum class KeyFactoryError {
    INVALID_PUBLIC_KEY_DER = 1,  ///< bytes cannot be decoded as X.509 SPKI
    TRAILING_DATA,               ///< bytes left after the SPKI structure
    NON_CANONICAL_ENCODING,      ///< SPKI is BER, not DER
    WRONG_PUBLIC_KEY_SIZE,       ///< raw key has wrong size
    INVALID_PUBLIC_KEY,          ///< raw key is rejected by OpenSSL
  };

  enum class OpenSslError {
    FAILED_ENCODE_KEY = 1,  ///< i2d_PUBKEY failed
    FAILED_GET_RAW_KEY,     ///< raw key bytes are not available
    EMPTY_KEY,              ///< key handle holds no key
  };
}  // namespace edkey::crypto

OUTCOME_HPP_DECLARE_ERROR(edkey::crypto, KeyCodecError)
OUTCOME_HPP_DECLARE_ERROR(edkey::crypto, KeyFactoryError)
OUTCOME_HPP_DECLARE_ERROR(edkey::crypto, OpenSslError)

#endif  // EDKEY_CRYPTO_ERROR_HPP
