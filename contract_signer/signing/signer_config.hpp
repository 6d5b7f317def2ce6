/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGNER_CONFIG_HPP
#define CONSIGN_SIGNER_CONFIG_HPP

#include <optional>
#include <string>

#include <boost/variant.hpp>
#include "common/result_fwd.hpp"
#include "did/did_document.hpp"
#include "error/signing_error.hpp"

namespace consign {

  /// Identity given directly on the command line
  struct AdHocSignerConfig {
    std::optional<std::string> issuer;
    std::optional<std::string> key_id;
    /// algorithm name, e.g. "ES256"
    std::optional<std::string> algorithm;
  };

  /// Identity taken from a DID document
  struct DidSignerConfig {
    DidDocument document;
    std::optional<std::string> key_id;
  };

  using SignerConfig = boost::variant<AdHocSignerConfig, DidSignerConfig>;

  /**
   * Reject a DID document combined with an explicit issuer or algorithm.
   * Reads nothing, so it can run before any input is touched.
   * @return kConfigurationConflict error on conflict
   */
  expected::Result<void, SigningError> checkSignerOptions(
      const std::optional<std::string> &did_document_path,
      const std::optional<std::string> &issuer,
      const std::optional<std::string> &algorithm);

  /**
   * Turn raw options into a signer configuration, loading the DID document
   * when a path is given.
   * @return configuration, kConfigurationConflict error for conflicting
   * options, kFileAccess error for an unreadable document or kDidResolution
   * error for a malformed one
   */
  expected::Result<SignerConfig, SigningError> makeSignerConfig(
      const std::optional<std::string> &did_document_path,
      const std::optional<std::string> &key_id,
      const std::optional<std::string> &issuer,
      const std::optional<std::string> &algorithm);

}  // namespace consign

#endif  // CONSIGN_SIGNER_CONFIG_HPP
