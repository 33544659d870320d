/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <edkey/common/types.hpp>
#include <edkey/crypto/public_key.hpp>
#include <edkey/outcome/outcome.hpp>

namespace edkey::crypto {

  /**
   * @class Binding to the cryptography library: turns encoded key material
   * into PublicKey handles
   */
  class KeyFactory {
   public:
    virtual ~KeyFactory() = default;

    /**
     * @brief decode X.509 SubjectPublicKeyInfo DER bytes. Any algorithm the
     * cryptography library supports is accepted, checking the algorithm is up
     * to the caller
     * @param der - encoded SubjectPublicKeyInfo
     * @return public key or error code
     */
    virtual outcome::result<PublicKey> generatePublic(BytesIn der) const = 0;

    /**
     * @brief build Ed25519 public key from its raw form
     * @param raw - 32 bytes of the key
     * @return public key or error code
     */
    virtual outcome::result<PublicKey> ed25519FromRaw(BytesIn raw) const = 0;
  };

}  // namespace edkey::crypto
