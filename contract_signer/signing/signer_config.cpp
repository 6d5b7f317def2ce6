/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "signing/signer_config.hpp"

#include <fmt/core.h>
#include "common/files.hpp"
#include "common/result.hpp"
#include "common/result_try.hpp"

namespace consign {

  expected::Result<void, SigningError> checkSignerOptions(
      const std::optional<std::string> &did_document_path,
      const std::optional<std::string> &issuer,
      const std::optional<std::string> &algorithm) {
    if (did_document_path and (issuer or algorithm)) {
      return expected::makeError(
          SigningError{SigningError::ErrorCode::kConfigurationConflict,
                       "issuer/alg and DID document are mutually exclusive"});
    }
    return {};
  }

  expected::Result<SignerConfig, SigningError> makeSignerConfig(
      const std::optional<std::string> &did_document_path,
      const std::optional<std::string> &key_id,
      const std::optional<std::string> &issuer,
      const std::optional<std::string> &algorithm) {
    CONSIGN_EXPECTED_ERROR_CHECK(
        checkSignerOptions(did_document_path, issuer, algorithm));

    if (not did_document_path) {
      return expected::makeValue(
          SignerConfig{AdHocSignerConfig{issuer, key_id, algorithm}});
    }

    CONSIGN_EXPECTED_TRY_GET_VALUE(
        text,
        expected::map_error<SigningError>(
            readTextFile(*did_document_path), [](std::string error) {
              return SigningError{SigningError::ErrorCode::kFileAccess,
                                  std::move(error)};
            }));
    return expected::map_error<SigningError>(
               parseDidDocument(text),
               [&did_document_path](std::string error) {
                 return SigningError{
                     SigningError::ErrorCode::kDidResolution,
                     fmt::format("DID document '{}' is malformed: {}",
                                 *did_document_path,
                                 error)};
               })
        | [&key_id](auto &&document) {
            return SignerConfig{
                DidSignerConfig{std::move(document), key_id}};
          };
  }

}  // namespace consign
