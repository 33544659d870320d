/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/public_key.hpp>

#include <array>

#include <openssl/x509.h>
#include <edkey/common/final_action.hpp>
#include <edkey/crypto/error.hpp>

namespace edkey::crypto {
  namespace {
    KeyType keyTypeOf(const EVP_PKEY *pkey) {
      switch (EVP_PKEY_get_id(pkey)) {
        case EVP_PKEY_ED25519:
          return KeyType::Ed25519;
        case EVP_PKEY_ED448:
          return KeyType::Ed448;
        case EVP_PKEY_X25519:
          return KeyType::X25519;
        case EVP_PKEY_RSA:
        case EVP_PKEY_RSA_PSS:
          return KeyType::RSA;
        case EVP_PKEY_EC: {
          std::array<char, 80> group{};
          size_t group_len{0};
          if (1
                  == EVP_PKEY_get_group_name(
                      pkey, group.data(), group.size(), &group_len)
              && std::string_view(group.data(), group_len) == "secp256k1") {
            return KeyType::Secp256k1;
          }
          return KeyType::ECDSA;
        }
        default:
          return KeyType::UNKNOWN;
      }
    }
  }  // namespace

  PublicKey::PublicKey(std::shared_ptr<EVP_PKEY> pkey)
      : pkey_{std::move(pkey)} {}

  KeyType PublicKey::type() const {
    if (nullptr == pkey_) {
      return KeyType::UNSPECIFIED;
    }
    return keyTypeOf(pkey_.get());
  }

  std::string_view PublicKey::algorithm() const {
    return toString(type());
  }

  outcome::result<Bytes> PublicKey::encoded() const {
    if (nullptr == pkey_) {
      return OpenSslError::EMPTY_KEY;
    }

    unsigned char *buffer{nullptr};
    common::FinalAction free_buffer([&buffer] { OPENSSL_free(buffer); });

    int length = i2d_PUBKEY(pkey_.get(), &buffer);
    if (length <= 0) {
      return OpenSslError::FAILED_ENCODE_KEY;
    }
    return Bytes(buffer, buffer + length);
  }

  outcome::result<Bytes> PublicKey::raw() const {
    if (nullptr == pkey_) {
      return OpenSslError::EMPTY_KEY;
    }

    size_t length{0};
    if (1 != EVP_PKEY_get_raw_public_key(pkey_.get(), nullptr, &length)) {
      return OpenSslError::FAILED_GET_RAW_KEY;
    }
    Bytes raw(length);
    if (1 != EVP_PKEY_get_raw_public_key(pkey_.get(), raw.data(), &length)) {
      return OpenSslError::FAILED_GET_RAW_KEY;
    }
    raw.resize(length);
    return raw;
  }

  bool PublicKey::empty() const {
    return nullptr == pkey_;
  }

  bool PublicKey::operator==(const PublicKey &other) const {
    if (pkey_ == nullptr || other.pkey_ == nullptr) {
      return pkey_ == other.pkey_;
    }
    return 1 == EVP_PKEY_eq(pkey_.get(), other.pkey_.get());
  }

}  // namespace edkey::crypto
