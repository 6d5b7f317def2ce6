/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGNING_ERROR_HPP
#define CONSIGN_SIGNING_ERROR_HPP

#include <string>

namespace consign {

  /**
   * Failure of a contract signing step. Every failure is terminal: the
   * caller reports the message and produces no output.
   */
  struct SigningError {
    enum class ErrorCode {
      /// registration info entry does not match [type:]name=content
      kArgumentFormat,
      /// entry content cannot be converted to its declared type
      kTypeCoercion,
      /// DID document combined with explicit issuer or algorithm
      kConfigurationConflict,
      /// input file missing or unreadable
      kFileAccess,
      /// private key or DID document could not be decoded
      kKeyFormat,
      /// unknown algorithm or algorithm incompatible with the key
      kUnsupportedAlgorithm,
      /// existing envelope is not a valid COSE_Sign message
      kEnvelopeDecode,
      /// no usable verification method in the DID document
      kDidResolution,
      /// cryptographic operation failed
      kSigningFailure,
      /// no signature of an envelope verifies with the given key
      kSignatureVerification,
    };

    ErrorCode code;
    std::string message;

    std::string toString() const;
  };

  /// @return name of the error code, e.g. "ArgumentFormatError"
  const char *errorCodeName(SigningError::ErrorCode code);

}  // namespace consign

#endif  // CONSIGN_SIGNING_ERROR_HPP
