/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/key_factory/openssl_key_factory.hpp>

#include <algorithm>

#include <openssl/err.h>
#include <openssl/x509.h>
#include <edkey/crypto/error.hpp>

namespace edkey::crypto {

  outcome::result<PublicKey> OpenSslKeyFactory::generatePublic(
      BytesIn der) const {
    if (der.empty()) {
      return KeyFactoryError::INVALID_PUBLIC_KEY_DER;
    }

    /*
     * d2i_PUBKEY() is the generic X.509 decoder, it accepts any algorithm
     * OpenSSL has a decoder for, and advances the cursor past the structure
     */
    const unsigned char *cursor = der.data();
    std::shared_ptr<EVP_PKEY> pkey{
        d2i_PUBKEY(nullptr, &cursor, static_cast<long>(der.size())),
        EVP_PKEY_free};
    if (nullptr == pkey) {
      ERR_clear_error();
      return KeyFactoryError::INVALID_PUBLIC_KEY_DER;
    }
    if (cursor != der.data() + der.size()) {
      return KeyFactoryError::TRAILING_DATA;
    }

    // the key must encode back to exactly the same bytes
    PublicKey key{std::move(pkey)};
    OUTCOME_TRY(encoded, key.encoded());
    if (!std::equal(encoded.begin(), encoded.end(), der.begin(), der.end())) {
      return KeyFactoryError::NON_CANONICAL_ENCODING;
    }
    return key;
  }

  outcome::result<PublicKey> OpenSslKeyFactory::ed25519FromRaw(
      BytesIn raw) const {
    if (raw.size() != kEd25519KeySize) {
      return KeyFactoryError::WRONG_PUBLIC_KEY_SIZE;
    }

    std::shared_ptr<EVP_PKEY> pkey{
        EVP_PKEY_new_raw_public_key(
            EVP_PKEY_ED25519, nullptr, raw.data(), raw.size()),
        EVP_PKEY_free};
    if (nullptr == pkey) {
      ERR_clear_error();
      return KeyFactoryError::INVALID_PUBLIC_KEY;
    }
    return PublicKey{std::move(pkey)};
  }

}  // namespace edkey::crypto
