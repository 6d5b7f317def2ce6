/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/envelope_verifier.hpp"

#include <fmt/format.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "cryptography/crypto_verifier.hpp"
#include "cryptography/public_key.hpp"
#include "envelope/cose_sign_message.hpp"

namespace {
  using namespace consign;

  expected::Result<cose::CoseSignMessage, SigningError> decodeMessage(
      ByteRange envelope) {
    return expected::map_error<SigningError>(
        cose::decodeCoseSign(envelope), [](std::string error) {
          return SigningError{SigningError::ErrorCode::kEnvelopeDecode,
                              std::move(error)};
        });
  }

  DecodedEnvelope toDecodedEnvelope(cose::CoseSignMessage message) {
    DecodedEnvelope envelope{std::move(message.payload),
                             std::move(message.body_headers),
                             {}};
    for (auto &signature : message.signatures) {
      envelope.signers.push_back(std::move(signature.headers));
    }
    return envelope;
  }
}  // namespace

namespace consign {

  expected::Result<DecodedEnvelope, SigningError> decodeEnvelope(
      ByteRange envelope) {
    return decodeMessage(envelope) |
        [](auto &&message) { return toDecodedEnvelope(std::move(message)); };
  }

  expected::Result<VerifiedEnvelope, SigningError> verifyEnvelope(
      ByteRange envelope, const crypto::PublicKey &public_key) {
    CONSIGN_EXPECTED_TRY_GET_VALUE(message, decodeMessage(envelope));

    std::vector<std::string> failures;
    for (size_t i = 0; i < message.signatures.size(); ++i) {
      const auto &signature = message.signatures[i];
      if (not signature.headers.algorithm) {
        failures.push_back(fmt::format("signature {}: no algorithm", i));
        continue;
      }
      const auto algorithm =
          crypto::algorithmFromCoseId(*signature.headers.algorithm);
      if (not algorithm) {
        failures.push_back(fmt::format("signature {}: unsupported algorithm {}",
                                       i,
                                       *signature.headers.algorithm));
        continue;
      }
      const auto to_be_signed =
          cose::makeSigStructure(makeByteRange(message.body_protected),
                                 makeByteRange(signature.protected_header),
                                 makeByteRange(message.payload));
      auto verified =
          crypto::CryptoVerifier::verify(makeByteRange(signature.signature),
                                         makeByteRange(to_be_signed),
                                         public_key,
                                         *algorithm);
      if (expected::hasValue(verified)) {
        return expected::makeValue(
            VerifiedEnvelope{toDecodedEnvelope(std::move(message)), i});
      }
      failures.push_back(
          fmt::format("signature {}: {}", i, verified.assumeError()));
    }
    return expected::makeError(SigningError{
        SigningError::ErrorCode::kSignatureVerification,
        fmt::format("no signature verifies with the given {} key: {}",
                    crypto::keyTypeName(public_key.type()),
                    fmt::join(failures, "; "))});
  }

}  // namespace consign
