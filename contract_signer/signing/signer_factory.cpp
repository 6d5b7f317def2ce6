/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signing/signer_factory.hpp"

#include <fmt/core.h>
#include <fmt/format.h>
#include "common/result.hpp"
#include "common/visitor.hpp"
#include "did/did_signer.hpp"
#include "logger/logger.hpp"

namespace consign {

  SignerFactory::SignerFactory(logger::LoggerPtr log) : log_(std::move(log)) {}

  expected::Result<Signer, SigningError> SignerFactory::build(
      crypto::PrivateKey key, const SignerConfig &config) const {
    auto signer = visit_in_place(
        config,
        [&](const AdHocSignerConfig &ad_hoc) {
          return buildAdHoc(std::move(key), ad_hoc);
        },
        [&](const DidSignerConfig &did) {
          log_->debug("Resolving signer from DID document {}",
                      did.document.id);
          return resolveSignerFromDid(std::move(key), did.document, did.key_id);
        });
    if (expected::hasValue(signer)) {
      log_->info("Using {}", signer.assumeValue().toString());
    }
    return signer;
  }

  expected::Result<Signer, SigningError> SignerFactory::buildAdHoc(
      crypto::PrivateKey key, const AdHocSignerConfig &config) const {
    std::optional<crypto::Algorithm> algorithm;
    if (config.algorithm) {
      algorithm = crypto::algorithmFromName(*config.algorithm);
      if (not algorithm) {
        return expected::makeError(SigningError{
            SigningError::ErrorCode::kUnsupportedAlgorithm,
            fmt::format("'{}' is not a supported algorithm, expected one of {}",
                        *config.algorithm,
                        fmt::join(crypto::supportedAlgorithmNames(), ", "))});
      }
      if (not crypto::isCompatible(*algorithm, key.type())) {
        return expected::makeError(SigningError{
            SigningError::ErrorCode::kUnsupportedAlgorithm,
            fmt::format("algorithm {} cannot be used with {} key",
                        *config.algorithm,
                        crypto::keyTypeName(key.type()))});
      }
    }
    return expected::makeValue(
        Signer{std::move(key), config.issuer, config.key_id, algorithm});
  }

}  // namespace consign
