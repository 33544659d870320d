/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/key_codec/key_codec_impl.hpp>

#include <atomic>
#include <random>
#include <thread>

#include <gtest/gtest.h>
#include <edkey/codec/base64.hpp>
#include <edkey/common/literals.hpp>
#include <edkey/crypto/key_codec/armor.hpp>
#include <edkey/crypto/key_factory/openssl_key_factory.hpp>
#include <testutil/foreign_keys.hpp>
#include <testutil/outcome.hpp>
#include <testutil/prepare_loggers.hpp>

using edkey::Bytes;
using edkey::crypto::KeyCodec;
using edkey::crypto::KeyCodecConfig;
using edkey::crypto::KeyCodecError;
using edkey::crypto::KeyCodecImpl;
using edkey::crypto::KeyFactory;
using edkey::crypto::KeyType;
using edkey::crypto::OpenSslKeyFactory;
using edkey::crypto::PublicKey;
using namespace edkey::common;

class KeyCodecTest : public ::testing::Test {
 public:
  void SetUp() override {
    testutil::prepareLoggers();
    codec_ = std::make_shared<KeyCodecImpl>(factory_);
  }

  /// Armor text the way a PEM writer on any platform could
  static std::string armorWith(const std::string &text,
                               size_t width,
                               const std::string &eol) {
    std::string out = std::string{edkey::crypto::kPemHeader} + eol;
    for (size_t i = 0; i < text.size(); i += width) {
      out += text.substr(i, width) + eol;
    }
    return out + std::string{edkey::crypto::kPemFooter} + eol;
  }

  std::shared_ptr<KeyFactory> factory_ = std::make_shared<OpenSslKeyFactory>();
  std::shared_ptr<KeyCodec> codec_;

  static constexpr std::string_view kKnownText =
      "MCowBQYDK2VwAyEAO2onvM62pC1io6jQKm8Nc2UyFXcd4kOmOsBIoYtZ2ik=";
  const Bytes known_raw_ =
      "3b6a27bcceb6a42d62a3a8d02a6f0d73653215771de243a63ac048a18b59da29"_unhex;
};

/**
 * @given text of a known Ed25519 key
 * @when decoding it and encoding the result again
 * @then the key holds the known raw bytes and the text is reproduced exactly
 */
TEST_F(KeyCodecTest, KnownVector) {
  EXPECT_OUTCOME_TRUE(key, codec_->stringToKey(kKnownText));
  EXPECT_EQ(key.type(), KeyType::Ed25519);
  EXPECT_OUTCOME_TRUE(raw, key.raw());
  EXPECT_EQ(raw, known_raw_);

  EXPECT_OUTCOME_TRUE(text, codec_->keyToString(key));
  EXPECT_EQ(text, kKnownText);
  EXPECT_EQ(text.size(), 60u);
}

/**
 * @given key built from raw bytes
 * @when encoding it
 * @then the known text is produced
 */
TEST_F(KeyCodecTest, KnownVectorFromRaw) {
  EXPECT_OUTCOME_TRUE(key, factory_->ed25519FromRaw(known_raw_));
  EXPECT_OUTCOME_TRUE(text, codec_->keyToString(key));
  EXPECT_EQ(text, kKnownText);
}

/**
 * @given freshly generated Ed25519 keys
 * @when encoding and decoding them
 * @then DER encoding of the decoded key equals the original one
 */
TEST_F(KeyCodecTest, RoundTrip) {
  for (int i = 0; i < 16; ++i) {
    auto key = testutil::generateEd25519();
    EXPECT_OUTCOME_TRUE(text, codec_->keyToString(key));
    EXPECT_OUTCOME_TRUE(decoded, codec_->stringToKey(text));
    EXPECT_OUTCOME_TRUE(original_der, key.encoded());
    EXPECT_OUTCOME_TRUE(decoded_der, decoded.encoded());
    EXPECT_EQ(decoded_der, original_der);
    EXPECT_EQ(decoded, key);
  }
}

/**
 * @given encoded key and its armored forms, folded at every column with
 * "\n", "\r\n" and "\r"
 * @when decoding each of them
 * @then all of them give the same key
 */
TEST_F(KeyCodecTest, ArmorInsensitive) {
  std::string text{kKnownText};
  EXPECT_OUTCOME_TRUE(expected, codec_->stringToKey(text));
  for (std::string eol : {"\n", "\r\n", "\r"}) {
    for (size_t width = 1; width <= text.size(); ++width) {
      EXPECT_OUTCOME_TRUE(key, codec_->stringToKey(armorWith(text, width, eol)));
      EXPECT_EQ(key, expected) << "width " << width << ", eol " << eol.size();
    }
  }
}

/**
 * @given Ed25519 key
 * @when encoding it as PEM and decoding the result
 * @then output has the PEM layout and decodes to the same key
 */
TEST_F(KeyCodecTest, PemOutput) {
  auto key = testutil::generateEd25519();
  EXPECT_OUTCOME_TRUE(text, codec_->keyToString(key));
  EXPECT_OUTCOME_TRUE(pem, codec_->keyToPem(key));
  EXPECT_EQ(pem,
            "-----BEGIN PUBLIC KEY-----\n" + text
                + "\n-----END PUBLIC KEY-----\n");
  EXPECT_OUTCOME_TRUE(decoded, codec_->stringToKey(pem));
  EXPECT_EQ(decoded, key);
}

/**
 * @given codec configured with a narrow PEM line width
 * @when encoding a key as PEM
 * @then payload is folded at that width
 */
TEST_F(KeyCodecTest, PemLineWidth) {
  KeyCodecImpl narrow{factory_, KeyCodecConfig{.pem_line_width = 16}};
  EXPECT_OUTCOME_TRUE(key, codec_->stringToKey(kKnownText));
  EXPECT_OUTCOME_TRUE(pem, narrow.keyToPem(key));
  EXPECT_EQ(pem,
            "-----BEGIN PUBLIC KEY-----\n"
            "MCowBQYDK2VwAyEA\n"
            "O2onvM62pC1io6jQ\n"
            "Km8Nc2UyFXcd4kOm\n"
            "OsBIoYtZ2ik=\n"
            "-----END PUBLIC KEY-----\n");
}

/**
 * @given keys of other algorithms and an empty key
 * @when encoding them
 * @then ALGORITHM_MISMATCH is returned
 */
TEST_F(KeyCodecTest, KeyToStringRejectsOtherAlgorithms) {
  EXPECT_EC(codec_->keyToString(testutil::generateRsa()),
            KeyCodecError::ALGORITHM_MISMATCH);
  EXPECT_EC(codec_->keyToString(testutil::generateEcdsaP256()),
            KeyCodecError::ALGORITHM_MISMATCH);
  EXPECT_EC(codec_->keyToString(testutil::generateEd448()),
            KeyCodecError::ALGORITHM_MISMATCH);
  EXPECT_EC(codec_->keyToPem(testutil::generateX25519()),
            KeyCodecError::ALGORITHM_MISMATCH);
  EXPECT_EC(codec_->keyToString(PublicKey{}),
            KeyCodecError::ALGORITHM_MISMATCH);
}

/**
 * @given well formed SubjectPublicKeyInfo texts of other algorithms
 * @when decoding them
 * @then ALGORITHM_MISMATCH is returned
 */
TEST_F(KeyCodecTest, StringToKeyRejectsOtherAlgorithms) {
  for (auto key : {testutil::generateRsa(),
                   testutil::generateEcdsaP256(),
                   testutil::generateX25519(),
                   testutil::generateEd448()}) {
    EXPECT_OUTCOME_TRUE(der, key.encoded());
    auto text = edkey::codec::encodeBase64(der);
    SCOPED_TRACE(key.algorithm());
    EXPECT_EC(codec_->stringToKey(text), KeyCodecError::ALGORITHM_MISMATCH);
    EXPECT_EC(codec_->stringToKey(edkey::crypto::armor(text, 64)),
              KeyCodecError::ALGORITHM_MISMATCH);
  }
}

/**
 * @given text which is not base64
 * @when decoding it
 * @then MALFORMED_BASE64 is returned
 */
TEST_F(KeyCodecTest, MalformedBase64) {
  EXPECT_EC(codec_->stringToKey("not-base64!!"),
            KeyCodecError::MALFORMED_BASE64);
  // padding dropped
  EXPECT_EC(codec_->stringToKey(kKnownText.substr(0, kKnownText.size() - 1)),
            KeyCodecError::MALFORMED_BASE64);
  // line breaks are only tolerated inside armor
  EXPECT_EC(codec_->stringToKey(std::string{kKnownText} + "\n"),
            KeyCodecError::MALFORMED_BASE64);
  // armor of another key type is not stripped
  EXPECT_EC(codec_->stringToKey("-----BEGIN RSA PUBLIC KEY-----\n"
                                + std::string{kKnownText}
                                + "\n-----END RSA PUBLIC KEY-----\n"),
            KeyCodecError::MALFORMED_BASE64);
}

/**
 * @given base64 of bytes which are not a SubjectPublicKeyInfo
 * @when decoding it
 * @then MALFORMED_KEY_ENCODING is returned
 */
TEST_F(KeyCodecTest, MalformedKeyEncoding) {
  std::mt19937 gen(42);
  std::uniform_int_distribution<int> dist(0, 255);
  for (size_t size : {1u, 16u, 32u, 44u, 100u}) {
    Bytes random(size);
    for (auto &b : random) {
      b = static_cast<uint8_t>(dist(gen));
    }
    // DER SEQUENCE tag never comes first, so this can not be a valid key
    random[0] = 0x04;
    EXPECT_EC(codec_->stringToKey(edkey::codec::encodeBase64(random)),
              KeyCodecError::MALFORMED_KEY_ENCODING);
  }
  EXPECT_EC(codec_->stringToKey(""), KeyCodecError::MALFORMED_KEY_ENCODING);

  // Ed25519 OID with a 31 byte key
  auto short_key =
      "3029300506032b6570032000"
      "3b6a27bcceb6a42d62a3a8d02a6f0d73653215771de243a63ac048a18b59da"_unhex;
  EXPECT_EC(codec_->stringToKey(edkey::codec::encodeBase64(short_key)),
            KeyCodecError::MALFORMED_KEY_ENCODING);
}

/**
 * @given megabyte long texts, valid base64 and armored
 * @when decoding them
 * @then MALFORMED_KEY_ENCODING is returned
 */
TEST_F(KeyCodecTest, LongInput) {
  std::string text(1 << 20, 'A');
  EXPECT_EC(codec_->stringToKey(text), KeyCodecError::MALFORMED_KEY_ENCODING);
  EXPECT_EC(codec_->stringToKey(edkey::crypto::armor(text, 64)),
            KeyCodecError::MALFORMED_KEY_ENCODING);

  text.back() = '!';
  EXPECT_EC(codec_->stringToKey(text), KeyCodecError::MALFORMED_BASE64);
}

/**
 * @given one codec shared by several threads
 * @when they decode and encode keys at the same time
 * @then every thread gets correct results
 */
TEST_F(KeyCodecTest, ConcurrentUse) {
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([this, &failures] {
      for (int i = 0; i < 50; ++i) {
        auto key = codec_->stringToKey(kKnownText);
        if (!key) {
          ++failures;
          continue;
        }
        auto text = codec_->keyToString(key.value());
        if (!text || text.value() != kKnownText) {
          ++failures;
        }
      }
    });
  }
  for (auto &thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures, 0);
}
