/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/contract_signer.hpp"

#include <algorithm>

#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include "cryptography/public_key.hpp"
#include "envelope/cose_sign_message.hpp"
#include "envelope/envelope_verifier.hpp"
#include "framework/mock_logger.hpp"
#include "framework/result_gtest_checkers.hpp"
#include "framework/test_keys.hpp"
#include "framework/test_logger.hpp"

using namespace consign;
using ErrorCode = SigningError::ErrorCode;

namespace {
  const std::string kContract = "The parties agree to the terms below.";
  const std::string kContentType = "text/plain";

  Signer makeSigner(crypto::KeyType type,
                    std::optional<std::string> issuer = std::nullopt,
                    std::optional<std::string> key_id = std::nullopt,
                    std::optional<crypto::Algorithm> algorithm = std::nullopt) {
    return Signer{framework::generateTestKey(type),
                  std::move(issuer),
                  std::move(key_id),
                  algorithm};
  }

  RegistrationInfo parseAll(const std::vector<std::string> &raw) {
    RegistrationInfo entries;
    for (const auto &r : raw) {
      entries.push_back(parseRegistrationInfo(r).assumeValue());
    }
    return entries;
  }
}  // namespace

class ContractSignerTest : public ::testing::Test {
 public:
  expected::Result<Bytes, SigningError> create(
      const Signer &signer,
      const std::optional<std::string> &feed = std::nullopt,
      const RegistrationInfo &info = {}) {
    return contract_signer.sign(
        signer, makeByteRange(kContract), kContentType, false, feed, info);
  }

  expected::Result<Bytes, SigningError> append(const Signer &signer,
                                                const Bytes &envelope) {
    return contract_signer.sign(
        signer, makeByteRange(envelope), kContentType, true, std::nullopt, {});
  }

  ContractSigner contract_signer{getTestLogger("ContractSigner")};
};

/**
 * @given an ad-hoc signer with issuer and key id
 * @when a contract is signed
 * @then the envelope carries the contract, the headers and a signature that
 * verifies with the signer's public key
 */
TEST_F(ContractSignerTest, CreateEnvelope) {
  const auto signer =
      makeSigner(crypto::KeyType::kEcP256, "did:web:example.com", "key-1");
  auto envelope =
      create(signer, "contracts", parseAll({"text:org=Contoso", "int:ver=7"}));
  CONSIGN_ASSERT_RESULT_VALUE(envelope);

  auto verified = verifyEnvelope(makeByteRange(envelope.assumeValue()),
                                 signer.key.publicKey());
  CONSIGN_ASSERT_RESULT_VALUE(verified);
  const auto &decoded = verified.assumeValue().envelope;

  EXPECT_EQ(std::string(decoded.payload.begin(), decoded.payload.end()),
            kContract);
  EXPECT_EQ(decoded.body_headers.content_type,
            std::optional<std::string>(kContentType));
  EXPECT_EQ(decoded.body_headers.feed, std::optional<std::string>("contracts"));
  ASSERT_EQ(decoded.body_headers.registration_info.size(), 2u);
  EXPECT_EQ(
      boost::get<std::string>(decoded.body_headers.registration_info[0].value),
      "Contoso");
  EXPECT_EQ(boost::get<int64_t>(decoded.body_headers.registration_info[1].value),
            7);

  ASSERT_EQ(decoded.signers.size(), 1u);
  EXPECT_EQ(decoded.signers[0].algorithm, std::optional<int64_t>(-7));
  EXPECT_EQ(decoded.signers[0].issuer,
            std::optional<std::string>("did:web:example.com"));
  EXPECT_EQ(decoded.signers[0].key_id, std::optional<std::string>("key-1"));
}

/**
 * @given a signer without identity
 * @when a contract is signed without feed or registration info
 * @then only the algorithm is present in the signature header
 */
TEST_F(ContractSignerTest, MinimalHeaders) {
  const auto signer = makeSigner(crypto::KeyType::kEd25519);
  auto envelope = create(signer);
  CONSIGN_ASSERT_RESULT_VALUE(envelope);

  auto decoded = decodeEnvelope(makeByteRange(envelope.assumeValue()));
  CONSIGN_ASSERT_RESULT_VALUE(decoded);
  const auto &headers = decoded.assumeValue().body_headers;
  EXPECT_FALSE(headers.feed);
  EXPECT_TRUE(headers.registration_info.empty());
  const auto &signer_headers = decoded.assumeValue().signers.at(0);
  EXPECT_EQ(signer_headers.algorithm, std::optional<int64_t>(-8));
  EXPECT_FALSE(signer_headers.issuer);
  EXPECT_FALSE(signer_headers.key_id);
}

TEST_F(ContractSignerTest, DuplicateRegistrationInfoLastWins) {
  const auto signer = makeSigner(crypto::KeyType::kEcP256);
  auto envelope = create(
      signer,
      std::nullopt,
      parseAll({"org=Contoso", "bytes:blob=raw", "org=Fabrikam"}));
  CONSIGN_ASSERT_RESULT_VALUE(envelope);

  auto decoded = decodeEnvelope(makeByteRange(envelope.assumeValue()));
  CONSIGN_ASSERT_RESULT_VALUE(decoded);
  const auto &info = decoded.assumeValue().body_headers.registration_info;
  ASSERT_EQ(info.size(), 2u);
  EXPECT_EQ(info[0].name, "org");
  EXPECT_EQ(boost::get<std::string>(info[0].value), "Fabrikam");
  EXPECT_EQ(info[1].type, RegistrationInfoType::kBytes);
}

/**
 * @given an explicit algorithm that does not fit the key
 * @when a contract is signed
 * @then an unsupported algorithm error is returned
 */
TEST_F(ContractSignerTest, IncompatibleAlgorithm) {
  const auto signer = makeSigner(crypto::KeyType::kEcP384,
                                 std::nullopt,
                                 std::nullopt,
                                 crypto::Algorithm::kEs256);
  CONSIGN_ASSERT_SIGNING_ERROR(create(signer), ErrorCode::kUnsupportedAlgorithm);
}

/**
 * @given an envelope signed by one party
 * @when a second party adds a signature
 * @then the body and the first signature are kept byte for byte and both
 * signatures verify
 */
TEST_F(ContractSignerTest, AddSignature) {
  const auto first =
      makeSigner(crypto::KeyType::kEcP256, "did:web:first.example");
  const auto second = makeSigner(crypto::KeyType::kRsa,
                                 "did:web:second.example",
                                 std::nullopt,
                                 crypto::Algorithm::kPs384);

  auto envelope = create(first, "contracts", parseAll({"org=Contoso"}));
  CONSIGN_ASSERT_RESULT_VALUE(envelope);
  auto original =
      cose::decodeCoseSign(makeByteRange(envelope.assumeValue()));
  CONSIGN_ASSERT_RESULT_VALUE(original);

  auto countersigned = append(second, envelope.assumeValue());
  CONSIGN_ASSERT_RESULT_VALUE(countersigned);
  const auto &bytes = countersigned.assumeValue();

  const auto &prefix = original.assumeValue().prefix;
  ASSERT_GT(bytes.size(), envelope.assumeValue().size());
  EXPECT_TRUE(std::equal(prefix.begin(), prefix.end(), bytes.begin()));

  auto decoded = cose::decodeCoseSign(makeByteRange(bytes));
  CONSIGN_ASSERT_RESULT_VALUE(decoded);
  ASSERT_EQ(decoded.assumeValue().signatures.size(), 2u);
  EXPECT_EQ(decoded.assumeValue().signatures[0].encoded,
            original.assumeValue().signatures[0].encoded);
  EXPECT_EQ(decoded.assumeValue().signatures[1].headers.algorithm,
            std::optional<int64_t>(-38));

  auto by_first = verifyEnvelope(makeByteRange(bytes), first.key.publicKey());
  CONSIGN_ASSERT_RESULT_VALUE(by_first);
  EXPECT_EQ(by_first.assumeValue().signature_index, 0u);

  auto by_second = verifyEnvelope(makeByteRange(bytes), second.key.publicKey());
  CONSIGN_ASSERT_RESULT_VALUE(by_second);
  EXPECT_EQ(by_second.assumeValue().signature_index, 1u);
}

/**
 * @given an envelope
 * @when a signature is added with feed and registration info
 * @then they are ignored and the body header is unchanged
 */
TEST_F(ContractSignerTest, AddSignatureIgnoresBodyArguments) {
  const auto signer = makeSigner(crypto::KeyType::kEcP256);
  auto envelope = create(signer);
  CONSIGN_ASSERT_RESULT_VALUE(envelope);

  auto countersigned =
      contract_signer.sign(signer,
                           makeByteRange(envelope.assumeValue()),
                           "application/json",
                           true,
                           std::string("other-feed"),
                           parseAll({"org=Contoso"}));
  CONSIGN_ASSERT_RESULT_VALUE(countersigned);

  auto decoded = decodeEnvelope(makeByteRange(countersigned.assumeValue()));
  CONSIGN_ASSERT_RESULT_VALUE(decoded);
  const auto &headers = decoded.assumeValue().body_headers;
  EXPECT_EQ(headers.content_type, std::optional<std::string>(kContentType));
  EXPECT_FALSE(headers.feed);
  EXPECT_TRUE(headers.registration_info.empty());
}

/**
 * @given a signed envelope
 * @when a signature is added with a feed and registration info
 * @then a warning says they are ignored
 */
TEST_F(ContractSignerTest, AddSignatureWarnsAboutIgnoredArguments) {
  using ::testing::_;
  using ::testing::HasSubstr;
  using ::testing::Return;

  const auto signer = makeSigner(crypto::KeyType::kEcP256);
  auto envelope = create(signer);
  CONSIGN_ASSERT_RESULT_VALUE(envelope);

  auto log = std::make_shared<::testing::NiceMock<framework::MockLogger>>();
  ON_CALL(*log, shouldLog(_)).WillByDefault(Return(true));
  EXPECT_CALL(*log, logInternal(_, _)).Times(::testing::AnyNumber());
  EXPECT_CALL(*log,
              logInternal(logger::LogLevel::kWarn, HasSubstr("are ignored")))
      .Times(1);

  ContractSigner warned_signer(log);
  CONSIGN_ASSERT_RESULT_VALUE(
      warned_signer.sign(signer,
                         makeByteRange(envelope.assumeValue()),
                         kContentType,
                         true,
                         std::string("other-feed"),
                         {}));
}

TEST_F(ContractSignerTest, AddSignatureToPlainContract) {
  const auto signer = makeSigner(crypto::KeyType::kEcP256);
  const Bytes plain(kContract.begin(), kContract.end());
  CONSIGN_ASSERT_SIGNING_ERROR(append(signer, plain),
                               ErrorCode::kEnvelopeDecode);
}

/**
 * @given a signed envelope
 * @when its payload is altered or it is checked against another key
 * @then verification fails
 */
TEST_F(ContractSignerTest, TamperedEnvelopeFailsVerification) {
  const auto signer = makeSigner(crypto::KeyType::kEcP256);
  auto envelope = create(signer);
  CONSIGN_ASSERT_RESULT_VALUE(envelope);

  auto tampered = envelope.assumeValue();
  auto position = std::search(
      tampered.begin(), tampered.end(), kContract.begin(), kContract.end());
  ASSERT_NE(position, tampered.end());
  *position ^= 0x20;
  CONSIGN_ASSERT_SIGNING_ERROR(
      verifyEnvelope(makeByteRange(tampered), signer.key.publicKey()),
      ErrorCode::kSignatureVerification);

  const auto stranger = makeSigner(crypto::KeyType::kEcP256);
  CONSIGN_ASSERT_SIGNING_ERROR(
      verifyEnvelope(makeByteRange(envelope.assumeValue()),
                     stranger.key.publicKey()),
      ErrorCode::kSignatureVerification);
}
