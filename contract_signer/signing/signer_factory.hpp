/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGNER_FACTORY_HPP
#define CONSIGN_SIGNER_FACTORY_HPP

#include "common/result_fwd.hpp"
#include "error/signing_error.hpp"
#include "logger/logger_fwd.hpp"
#include "signing/signer.hpp"
#include "signing/signer_config.hpp"

namespace consign {

  /**
   * Builds the signer for an invocation from the private key and the signer
   * configuration.
   */
  class SignerFactory {
   public:
    explicit SignerFactory(logger::LoggerPtr log);

    /**
     * @param key - private key, moved into the signer
     * @param config - ad-hoc identity or DID document
     * @return signer, kUnsupportedAlgorithm error for an unknown algorithm
     * or one the key cannot produce, kDidResolution error when the DID
     * document does not authorize the key
     */
    expected::Result<Signer, SigningError> build(
        crypto::PrivateKey key, const SignerConfig &config) const;

   private:
    expected::Result<Signer, SigningError> buildAdHoc(
        crypto::PrivateKey key, const AdHocSignerConfig &config) const;

    logger::LoggerPtr log_;
  };

}  // namespace consign

#endif  // CONSIGN_SIGNER_FACTORY_HPP
