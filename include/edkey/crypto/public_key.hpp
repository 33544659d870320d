/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string_view>

#include <openssl/evp.h>

#include <edkey/common/types.hpp>
#include <edkey/crypto/key_type.hpp>
#include <edkey/outcome/outcome.hpp>

namespace edkey::crypto {

  /**
   * Public key handle over an OpenSSL EVP_PKEY. Copies share the same
   * underlying key, which is never modified after construction, so a key may
   * be read from several threads at once.
   */
  class PublicKey {
   public:
    /// Empty handle, reports KeyType::UNSPECIFIED
    PublicKey() = default;

    explicit PublicKey(std::shared_ptr<EVP_PKEY> pkey);

    /**
     * @return algorithm of the key, UNSPECIFIED for an empty handle
     */
    KeyType type() const;

    /**
     * @return printable algorithm name, e.g. "Ed25519"
     */
    std::string_view algorithm() const;

    /**
     * @brief serialize the key as X.509 SubjectPublicKeyInfo
     * @return DER bytes or error code
     */
    outcome::result<Bytes> encoded() const;

    /**
     * @brief raw key bytes, available for Ed25519, Ed448 and X25519 keys
     * @return 32 bytes for an Ed25519 key or error code
     */
    outcome::result<Bytes> raw() const;

    bool empty() const;

    bool operator==(const PublicKey &other) const;

   private:
    std::shared_ptr<EVP_PKEY> pkey_;
  };

}  // namespace edkey::crypto
