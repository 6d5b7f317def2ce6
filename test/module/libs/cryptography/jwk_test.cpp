/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/jwk.hpp"

#include <gtest/gtest.h>
#include "cryptography/base64url.hpp"
#include "cryptography/private_key.hpp"
#include "cryptography/public_key.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_keys.hpp"

using namespace consign;
using namespace consign::crypto;

TEST(Base64UrlTest, EncodesWithoutPadding) {
  EXPECT_EQ(base64UrlEncode(makeByteRange(std::string("f"))), "Zg");
  EXPECT_EQ(base64UrlEncode(makeByteRange(std::string("fo"))), "Zm8");
  EXPECT_EQ(base64UrlEncode(makeByteRange(std::string("foo"))), "Zm9v");
  const Bytes url_unsafe{0xfb, 0xff};
  EXPECT_EQ(base64UrlEncode(makeByteRange(url_unsafe)), "-_8");
}

TEST(Base64UrlTest, DecodesPaddedAndUnpadded) {
  auto unpadded = base64UrlDecode("-_8");
  CONSIGN_ASSERT_RESULT_VALUE(unpadded);
  EXPECT_EQ(unpadded.assumeValue(), (Bytes{0xfb, 0xff}));

  auto padded = base64UrlDecode("Zm8=");
  CONSIGN_ASSERT_RESULT_VALUE(padded);
  EXPECT_EQ(padded.assumeValue(), (Bytes{'f', 'o'}));

  CONSIGN_ASSERT_RESULT_ERROR(base64UrlDecode("Zm9v!"));
}

/**
 * @given keys of every supported type
 * @when their public part is exported as JWK
 * @then the JWK carries the expected members and matches the key
 */
TEST(JwkTest, ExportedJwkMatchesKey) {
  for (auto type : {KeyType::kEcP256,
                    KeyType::kEcP384,
                    KeyType::kEcP521,
                    KeyType::kRsa,
                    KeyType::kEd25519}) {
    auto key = framework::generateTestKey(type).publicKey();
    auto jwk = toJwk(key);
    CONSIGN_ASSERT_RESULT_VALUE(jwk) << keyTypeName(type);
    EXPECT_TRUE(jwkMatchesKey(jwk.assumeValue(), key)) << keyTypeName(type);
  }
}

TEST(JwkTest, EcMembers) {
  auto key = framework::generateTestKey(KeyType::kEcP384).publicKey();
  auto jwk = toJwk(key);
  CONSIGN_ASSERT_RESULT_VALUE(jwk);
  EXPECT_EQ(jwk.assumeValue().kty, "EC");
  EXPECT_EQ(jwk.assumeValue().crv, std::optional<std::string>("P-384"));
  ASSERT_TRUE(jwk.assumeValue().x);
  // 48 bytes encode to 64 characters without padding
  EXPECT_EQ(jwk.assumeValue().x->size(), 64u);
  EXPECT_FALSE(jwk.assumeValue().n);
}

/**
 * @given the JWK of one key
 * @when it is compared with a different key
 * @then it does not match
 */
TEST(JwkTest, OtherKeyDoesNotMatch) {
  auto key = framework::generateTestKey(KeyType::kEcP256).publicKey();
  auto jwk = toJwk(key);
  CONSIGN_ASSERT_RESULT_VALUE(jwk);

  auto same_curve = framework::generateTestKey(KeyType::kEcP256).publicKey();
  EXPECT_FALSE(jwkMatchesKey(jwk.assumeValue(), same_curve));

  auto other_type = framework::generateTestKey(KeyType::kEd25519).publicKey();
  EXPECT_FALSE(jwkMatchesKey(jwk.assumeValue(), other_type));

  auto wrong_curve = jwk.assumeValue();
  wrong_curve.crv = "P-384";
  EXPECT_FALSE(jwkMatchesKey(wrong_curve, key));

  auto missing_y = jwk.assumeValue();
  missing_y.y.reset();
  EXPECT_FALSE(jwkMatchesKey(missing_y, key));
}

/**
 * @given an RSA JWK whose modulus carries a leading zero byte
 * @when it is compared with the key
 * @then it still matches
 */
TEST(JwkTest, RsaModulusLeadingZeroIgnored) {
  auto key = framework::generateTestKey(KeyType::kRsa).publicKey();
  auto jwk = toJwk(key);
  CONSIGN_ASSERT_RESULT_VALUE(jwk);

  auto modulus = base64UrlDecode(*jwk.assumeValue().n);
  CONSIGN_ASSERT_RESULT_VALUE(modulus);
  Bytes padded{0x00};
  padded.insert(padded.end(),
                modulus.assumeValue().begin(),
                modulus.assumeValue().end());

  auto padded_jwk = jwk.assumeValue();
  padded_jwk.n = base64UrlEncode(makeByteRange(padded));
  EXPECT_TRUE(jwkMatchesKey(padded_jwk, key));
}
