/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "envelope/contract_signer.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "cryptography/crypto_signer.hpp"
#include "envelope/cose_sign_message.hpp"
#include "logger/logger.hpp"

namespace consign {

  ContractSigner::ContractSigner(logger::LoggerPtr log)
      : log_(std::move(log)) {}

  expected::Result<Bytes, SigningError> ContractSigner::sign(
      const Signer &signer,
      ByteRange contract,
      const std::string &content_type,
      bool add_signature,
      const std::optional<std::string> &feed,
      const RegistrationInfo &registration_info) const {
    if (add_signature) {
      if (feed or not registration_info.empty()) {
        log_->warn(
            "Feed and registration info are ignored when adding a signature "
            "to an existing envelope");
      }
      return addSignature(signer, contract);
    }
    return createEnvelope(
        signer, contract, content_type, feed, registration_info);
  }

  expected::Result<Bytes, SigningError> ContractSigner::createEnvelope(
      const Signer &signer,
      ByteRange contract,
      const std::string &content_type,
      const std::optional<std::string> &feed,
      const RegistrationInfo &registration_info) const {
    cose::BodyHeaders headers{
        content_type, feed, foldRegistrationInfo(registration_info)};
    const auto body_protected = cose::encodeBodyHeaders(headers);

    CONSIGN_EXPECTED_TRY_GET_VALUE(
        signature,
        makeSignature(signer, makeByteRange(body_protected), contract));

    log_->info("Created envelope for {} byte contract of type {}",
               contract.size(),
               content_type);
    return expected::makeValue(cose::encodeCoseSign(
        makeByteRange(body_protected), contract, {std::move(signature)}));
  }

  expected::Result<Bytes, SigningError> ContractSigner::addSignature(
      const Signer &signer, ByteRange envelope) const {
    CONSIGN_EXPECTED_TRY_GET_VALUE(
        message,
        expected::map_error<SigningError>(
            cose::decodeCoseSign(envelope), [](std::string error) {
              return SigningError{
                  SigningError::ErrorCode::kEnvelopeDecode,
                  fmt::format("Contract is not a COSE_Sign envelope: {}",
                              error)};
            }));

    CONSIGN_EXPECTED_TRY_GET_VALUE(
        signature,
        makeSignature(signer,
                      makeByteRange(message.body_protected),
                      makeByteRange(message.payload)));

    log_->info("Adding signature {} to the envelope",
               message.signatures.size() + 1);
    return expected::makeValue(
        cose::appendSignature(message, makeByteRange(signature)));
  }

  expected::Result<Bytes, SigningError> ContractSigner::makeSignature(
      const Signer &signer, ByteRange body_protected, ByteRange payload) const {
    const auto algorithm = signer.effectiveAlgorithm();
    if (not crypto::isCompatible(algorithm, signer.key.type())) {
      return expected::makeError(SigningError{
          SigningError::ErrorCode::kUnsupportedAlgorithm,
          fmt::format("algorithm {} cannot be used with {} key",
                      crypto::algorithmName(algorithm),
                      crypto::keyTypeName(signer.key.type()))});
    }

    const auto sign_protected = cose::encodeSignerHeaders(
        cose::SignerHeaders{crypto::coseAlgorithmId(algorithm),
                            signer.key_id,
                            signer.issuer});
    const auto to_be_signed = cose::makeSigStructure(
        body_protected, makeByteRange(sign_protected), payload);
    log_->debug("Signing {} byte Sig_structure with {}",
                to_be_signed.size(),
                crypto::algorithmName(algorithm));

    return expected::map_error<SigningError>(
               crypto::CryptoSigner::sign(
                   makeByteRange(to_be_signed), signer.key, algorithm),
               [](std::string error) {
                 return SigningError{SigningError::ErrorCode::kSigningFailure,
                                     std::move(error)};
               })
        | [&sign_protected](auto &&signature) {
            return cose::encodeCoseSignature(makeByteRange(sign_protected),
                                             makeByteRange(signature));
          };
  }

}  // namespace consign
