/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <edkey/crypto/public_key.hpp>

#include <gtest/gtest.h>
#include <edkey/crypto/error.hpp>
#include <testutil/foreign_keys.hpp>
#include <testutil/outcome.hpp>

using edkey::crypto::KeyType;
using edkey::crypto::OpenSslError;
using edkey::crypto::PublicKey;

/**
 * @given default constructed key
 * @when querying it
 * @then it is empty and cannot be encoded
 */
TEST(PublicKeyTest, EmptyHandle) {
  PublicKey key;
  EXPECT_TRUE(key.empty());
  EXPECT_EQ(key.type(), KeyType::UNSPECIFIED);
  EXPECT_EQ(key.algorithm(), "unspecified");
  EXPECT_EC(key.encoded(), OpenSslError::EMPTY_KEY);
  EXPECT_EC(key.raw(), OpenSslError::EMPTY_KEY);
  EXPECT_EQ(key, PublicKey{});
}

/**
 * @given keys of different algorithms
 * @when asking for their type
 * @then the algorithm is recognized
 */
TEST(PublicKeyTest, Type) {
  EXPECT_EQ(testutil::generateEd25519().type(), KeyType::Ed25519);
  EXPECT_EQ(testutil::generateEd25519().algorithm(), "Ed25519");
  EXPECT_EQ(testutil::generateEd448().type(), KeyType::Ed448);
  EXPECT_EQ(testutil::generateX25519().type(), KeyType::X25519);
  EXPECT_EQ(testutil::generateRsa().type(), KeyType::RSA);
  EXPECT_EQ(testutil::generateEcdsaP256().type(), KeyType::ECDSA);
}

/**
 * @given Ed25519 key
 * @when encoding it
 * @then 44 bytes of SubjectPublicKeyInfo are produced, ending with the raw key
 */
TEST(PublicKeyTest, Ed25519Encoding) {
  auto key = testutil::generateEd25519();
  EXPECT_OUTCOME_TRUE(der, key.encoded());
  EXPECT_OUTCOME_TRUE(raw, key.raw());
  ASSERT_EQ(der.size(), 44u);
  ASSERT_EQ(raw.size(), 32u);
  EXPECT_TRUE(std::equal(raw.begin(), raw.end(), der.begin() + 12));
}

/**
 * @given two distinct keys and a copy of one of them
 * @when comparing them
 * @then only the copy is equal
 */
TEST(PublicKeyTest, Equality) {
  auto a = testutil::generateEd25519();
  auto b = testutil::generateEd25519();
  auto a_copy = a;
  EXPECT_EQ(a, a_copy);
  EXPECT_NE(a, b);
  EXPECT_NE(a, PublicKey{});
}
