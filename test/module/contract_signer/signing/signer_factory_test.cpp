/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signing/signer_factory.hpp"

#include <fmt/core.h>
#include <gtest/gtest.h>
#include "cryptography/jwk.hpp"
#include "cryptography/public_key.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_keys.hpp"
#include "framework/test_logger.hpp"

using namespace consign;
using ErrorCode = SigningError::ErrorCode;

class SignerFactoryTest : public ::testing::Test {
 public:
  /// DID document with one assertion method holding the given key
  std::string didDocumentFor(const crypto::PrivateKey &key) {
    const auto jwk = crypto::toJwk(key.publicKey()).assumeValue();
    return fmt::format(
        R"({{"id": "did:web:example.com",)"
        R"( "verificationMethod": [{{"id": "#key-1", "type": "JsonWebKey2020",)"
        R"( "publicKeyJwk": {{"kty": "EC", "crv": "{}", "x": "{}", "y": "{}"}}}}],)"
        R"( "assertionMethod": ["#key-1"]}})",
        *jwk.crv,
        *jwk.x,
        *jwk.y);
  }

  framework::TemporaryDirectory temp_dir;
  SignerFactory factory{getTestLogger("SignerFactory")};
};

/**
 * @given a DID document path together with an issuer or an algorithm
 * @when the options are checked
 * @then a configuration conflict is reported
 */
TEST_F(SignerFactoryTest, DidConflictsWithIssuerAndAlgorithm) {
  const std::optional<std::string> did_path = std::string("did.json");
  CONSIGN_ASSERT_SIGNING_ERROR(
      checkSignerOptions(did_path, std::string("did:web:x"), std::nullopt),
      ErrorCode::kConfigurationConflict);
  CONSIGN_ASSERT_SIGNING_ERROR(
      checkSignerOptions(did_path, std::nullopt, std::string("ES256")),
      ErrorCode::kConfigurationConflict);
  CONSIGN_ASSERT_RESULT_VALUE(
      checkSignerOptions(did_path, std::nullopt, std::nullopt));
  CONSIGN_ASSERT_RESULT_VALUE(checkSignerOptions(
      std::nullopt, std::string("did:web:x"), std::string("ES256")));

  // the document is never read when the options conflict
  CONSIGN_ASSERT_SIGNING_ERROR(
      makeSignerConfig((temp_dir / "missing.json").string(),
                       std::nullopt,
                       std::string("did:web:x"),
                       std::nullopt),
      ErrorCode::kConfigurationConflict);
}

TEST_F(SignerFactoryTest, AdHocSigner) {
  auto config = makeSignerConfig(std::nullopt,
                                 std::string("kid-1"),
                                 std::string("did:web:example.com"),
                                 std::string("ES256"));
  CONSIGN_ASSERT_RESULT_VALUE(config);

  auto signer =
      factory.build(framework::generateTestKey(crypto::KeyType::kEcP256),
                    config.assumeValue());
  CONSIGN_ASSERT_RESULT_VALUE(signer);
  EXPECT_EQ(signer.assumeValue().issuer,
            std::optional<std::string>("did:web:example.com"));
  EXPECT_EQ(signer.assumeValue().key_id, std::optional<std::string>("kid-1"));
  EXPECT_EQ(signer.assumeValue().effectiveAlgorithm(),
            crypto::Algorithm::kEs256);
}

/**
 * @given no explicit algorithm
 * @when a signer is built
 * @then the algorithm follows the key type
 */
TEST_F(SignerFactoryTest, AlgorithmInferredFromKey) {
  auto signer = factory.build(
      framework::generateTestKey(crypto::KeyType::kEcP521),
      SignerConfig{AdHocSignerConfig{std::nullopt, std::nullopt, std::nullopt}});
  CONSIGN_ASSERT_RESULT_VALUE(signer);
  EXPECT_FALSE(signer.assumeValue().algorithm);
  EXPECT_EQ(signer.assumeValue().effectiveAlgorithm(),
            crypto::Algorithm::kEs512);
}

TEST_F(SignerFactoryTest, UnknownAlgorithm) {
  auto signer = factory.build(
      framework::generateTestKey(crypto::KeyType::kEcP256),
      SignerConfig{AdHocSignerConfig{std::nullopt, std::nullopt, "RS256"}});
  CONSIGN_ASSERT_SIGNING_ERROR(signer, ErrorCode::kUnsupportedAlgorithm);
}

TEST_F(SignerFactoryTest, IncompatibleAlgorithm) {
  auto signer = factory.build(
      framework::generateTestKey(crypto::KeyType::kEd25519),
      SignerConfig{AdHocSignerConfig{std::nullopt, std::nullopt, "ES256"}});
  CONSIGN_ASSERT_SIGNING_ERROR(signer, ErrorCode::kUnsupportedAlgorithm);
}

/**
 * @given a DID document file listing the key
 * @when a signer is built from it
 * @then the identity comes from the document
 */
TEST_F(SignerFactoryTest, DidSigner) {
  auto key = framework::generateTestKey(crypto::KeyType::kEcP256);
  const auto did_path = temp_dir / "did.json";
  framework::writeTestFile(did_path, didDocumentFor(key));

  auto config = makeSignerConfig(
      did_path.string(), std::nullopt, std::nullopt, std::nullopt);
  CONSIGN_ASSERT_RESULT_VALUE(config);

  auto signer = factory.build(std::move(key), config.assumeValue());
  CONSIGN_ASSERT_RESULT_VALUE(signer);
  EXPECT_EQ(signer.assumeValue().issuer,
            std::optional<std::string>("did:web:example.com"));
  EXPECT_EQ(signer.assumeValue().key_id, std::optional<std::string>("#key-1"));
}

TEST_F(SignerFactoryTest, MissingDidDocument) {
  CONSIGN_ASSERT_SIGNING_ERROR(
      makeSignerConfig((temp_dir / "missing.json").string(),
                       std::nullopt,
                       std::nullopt,
                       std::nullopt),
      ErrorCode::kFileAccess);
}

TEST_F(SignerFactoryTest, MalformedDidDocument) {
  const auto did_path = temp_dir / "did.json";
  framework::writeTestFile(did_path, "{\"id\": 5}");
  CONSIGN_ASSERT_SIGNING_ERROR(
      makeSignerConfig(
          did_path.string(), std::nullopt, std::nullopt, std::nullopt),
      ErrorCode::kDidResolution);
}
