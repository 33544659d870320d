/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <edkey/crypto/key_factory.hpp>

namespace edkey::crypto {

  /**
   * @class KeyFactory on top of OpenSSL. Holds no state, one instance may be
   * shared by any number of threads
   */
  class OpenSslKeyFactory : public KeyFactory {
   public:
    static constexpr size_t kEd25519KeySize = 32;

    outcome::result<PublicKey> generatePublic(BytesIn der) const override;

    outcome::result<PublicKey> ed25519FromRaw(BytesIn raw) const override;
  };

}  // namespace edkey::crypto
