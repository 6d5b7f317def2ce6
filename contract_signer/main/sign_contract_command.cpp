/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "main/sign_contract_command.hpp"

#include <fmt/core.h>
#include "common/files.hpp"
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "crypto/key_loader.hpp"
#include "envelope/contract_signer.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "main/sign_contract_literals.hpp"
#include "signing/signer_factory.hpp"

namespace {
  consign::SigningError::ErrorCode toErrorCode(consign::KeyLoadError::Kind kind) {
    using Kind = consign::KeyLoadError::Kind;
    using ErrorCode = consign::SigningError::ErrorCode;
    switch (kind) {
      case Kind::kFileAccess:
        return ErrorCode::kFileAccess;
      case Kind::kKeyFormat:
        return ErrorCode::kKeyFormat;
      case Kind::kUnsupportedKeyType:
        return ErrorCode::kUnsupportedAlgorithm;
    }
    return ErrorCode::kKeyFormat;
  }

  consign::SigningError fileAccessError(std::string message) {
    return consign::SigningError{consign::SigningError::ErrorCode::kFileAccess,
                                 std::move(message)};
  }
}  // namespace

namespace consign {

  expected::Result<void, SigningError> signContract(
      const SignContractOptions &options,
      logger::LoggerManagerTreePtr log_manager) {
    auto log = log_manager->getLogger();

    if (not options.add_signature and options.content_type.empty()) {
      return expected::makeError(SigningError{
          SigningError::ErrorCode::kArgumentFormat,
          "a content type is required when creating an envelope"});
    }
    CONSIGN_EXPECTED_ERROR_CHECK(checkSignerOptions(
        options.did_doc, options.issuer, options.algorithm));
    if (options.out.extension() != config_members::EnvelopeExtension) {
      log->warn("Output file {} does not have the {} extension",
                options.out.string(),
                config_members::EnvelopeExtension);
    }

    KeyLoader key_loader(log_manager->getChild("KeyLoader")->getLogger());
    CONSIGN_EXPECTED_TRY_GET_VALUE(
        key,
        expected::map_error<SigningError>(
            key_loader.loadPrivateKey(options.key, options.key_passphrase),
            [](KeyLoadError error) {
              return SigningError{toErrorCode(error.kind),
                                  std::move(error.message)};
            }));

    CONSIGN_EXPECTED_TRY_GET_VALUE(config,
                                   makeSignerConfig(options.did_doc,
                                                    options.key_id,
                                                    options.issuer,
                                                    options.algorithm));

    SignerFactory factory(log_manager->getChild("SignerFactory")->getLogger());
    CONSIGN_EXPECTED_TRY_GET_VALUE(signer,
                                   factory.build(std::move(key), config));

    RegistrationInfo registration_info;
    for (const auto &raw : options.registration_info) {
      CONSIGN_EXPECTED_TRY_GET_VALUE(entry, parseRegistrationInfo(raw));
      log->debug("Registration info {}", raw);
      registration_info.push_back(std::move(entry));
    }

    CONSIGN_EXPECTED_TRY_GET_VALUE(
        contract,
        expected::map_error<SigningError>(readBinaryFile(options.contract),
                                          &fileAccessError));

    ContractSigner contract_signer(
        log_manager->getChild("ContractSigner")->getLogger());
    CONSIGN_EXPECTED_TRY_GET_VALUE(
        envelope,
        contract_signer.sign(signer,
                             makeByteRange(contract),
                             options.content_type,
                             options.add_signature,
                             options.feed,
                             registration_info));

    log->info("Writing {}", options.out.string());
    return expected::map_error<SigningError>(
        writeFileAtomically(options.out, makeByteRange(envelope)),
        &fileAccessError);
  }

}  // namespace consign
