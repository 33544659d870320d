/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/key_codec/key_codec_impl.hpp>

#include <boost/assert.hpp>

#include <edkey/codec/base64.hpp>
#include <edkey/common/hexutil.hpp>
#include <edkey/crypto/key_codec/armor.hpp>

namespace edkey::crypto {

  KeyCodecImpl::KeyCodecImpl(std::shared_ptr<KeyFactory> key_factory,
                             KeyCodecConfig config)
      : key_factory_{std::move(key_factory)},
        config_{config},
        log_{log::createLogger("KeyCodec", "codec")} {
    BOOST_ASSERT(key_factory_ != nullptr);
  }

  outcome::result<std::string> KeyCodecImpl::keyToString(
      const PublicKey &key) const {
    OUTCOME_TRY(ensureEd25519(key));
    OUTCOME_TRY(der, key.encoded());
    return codec::encodeBase64(der);
  }

  outcome::result<std::string> KeyCodecImpl::keyToPem(
      const PublicKey &key) const {
    OUTCOME_TRY(text, keyToString(key));
    return armor(text, config_.pem_line_width);
  }

  outcome::result<PublicKey> KeyCodecImpl::stringToKey(
      std::string_view text) const {
    auto payload = stripArmor(text);

    auto der = codec::decodeBase64(payload);
    if (!der) {
      log_->debug("rejected key text of {} symbols: {}",
                  payload.size(),
                  der.error());
      return KeyCodecError::MALFORMED_BASE64;
    }

    auto key = key_factory_->generatePublic(der.value());
    if (!key) {
      log_->debug("rejected key encoding of {} bytes: {}",
                  der.value().size(),
                  key.error());
      SL_TRACE(log_, "rejected bytes: {}", common::hex_lower(der.value()));
      return KeyCodecError::MALFORMED_KEY_ENCODING;
    }

    // generatePublic() accepts keys of any algorithm
    OUTCOME_TRY(ensureEd25519(key.value()));

    SL_TRACE(log_, "decoded Ed25519 key from {} symbols", payload.size());
    return std::move(key.value());
  }

  outcome::result<void> KeyCodecImpl::ensureEd25519(
      const PublicKey &key) const {
    if (key.type() != KeyType::Ed25519) {
      log_->debug("key type is {}, should be Ed25519", key.algorithm());
      return KeyCodecError::ALGORITHM_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace edkey::crypto
