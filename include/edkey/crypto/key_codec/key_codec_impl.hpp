/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>

#include <edkey/crypto/key_codec.hpp>
#include <edkey/crypto/key_codec/key_codec_config.hpp>
#include <edkey/crypto/key_factory.hpp>
#include <edkey/log/logger.hpp>

namespace edkey::crypto {

  class KeyCodecImpl : public KeyCodec {
   public:
    /**
     * Creates the "KeyCodec" logger of the "codec" group, so
     * log::setLoggingSystem() must have been called before
     * @param key_factory - decoder of SubjectPublicKeyInfo, not null
     * @param config - PEM output settings
     */
    explicit KeyCodecImpl(std::shared_ptr<KeyFactory> key_factory,
                          KeyCodecConfig config = {});

    outcome::result<std::string> keyToString(
        const PublicKey &key) const override;

    outcome::result<std::string> keyToPem(const PublicKey &key) const override;

    outcome::result<PublicKey> stringToKey(
        std::string_view text) const override;

   private:
    outcome::result<void> ensureEd25519(const PublicKey &key) const;

    std::shared_ptr<KeyFactory> key_factory_;
    KeyCodecConfig config_;
    log::Logger log_;
  };

}  // namespace edkey::crypto
