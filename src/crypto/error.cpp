/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/error.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(edkey::crypto, KeyCodecError, e) {
  using edkey::crypto::KeyCodecError;
  switch (e) {
    case KeyCodecError::ALGORITHM_MISMATCH:
      return "key algorithm is not Ed25519";
    case KeyCodecError::MALFORMED_BASE64:
      return "key text is not valid base64";
    case KeyCodecError::MALFORMED_KEY_ENCODING:
      return "key bytes are not an Ed25519 SubjectPublicKeyInfo";
  }
  return "unknown KeyCodecError code";
}

OUTCOME_CPP_DEFINE_CATEGORY(edkey::crypto, KeyFactoryError, e) {
  using edkey::crypto::KeyFactoryError;
  switch (e) {
    case KeyFactoryError::INVALID_PUBLIC_KEY_DER:
      return "failed to decode X.509 SubjectPublicKeyInfo";
    case KeyFactoryError::TRAILING_DATA:
      return "unexpected bytes after SubjectPublicKeyInfo";
    case KeyFactoryError::NON_CANONICAL_ENCODING:
      return "SubjectPublicKeyInfo is not DER encoded";
    case KeyFactoryError::WRONG_PUBLIC_KEY_SIZE:
      return "public key has wrong size";
    case KeyFactoryError::INVALID_PUBLIC_KEY:
      return "public key cannot be loaded";
  }
  return "unknown KeyFactoryError code";
}

OUTCOME_CPP_DEFINE_CATEGORY(edkey::crypto, OpenSslError, e) {
  using edkey::crypto::OpenSslError;
  switch (e) {
    case OpenSslError::FAILED_ENCODE_KEY:
      return "failed to encode public key";
    case OpenSslError::FAILED_GET_RAW_KEY:
      return "failed to get raw bytes of public key";
    case OpenSslError::EMPTY_KEY:
      return "public key handle is empty";
  }
  return "unknown OpenSslError code";
}
