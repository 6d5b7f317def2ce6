/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "error/signing_error.hpp"

#include <fmt/core.h>

namespace consign {

  const char *errorCodeName(SigningError::ErrorCode code) {
    using ErrorCode = SigningError::ErrorCode;
    switch (code) {
      case ErrorCode::kArgumentFormat:
        return "ArgumentFormatError";
      case ErrorCode::kTypeCoercion:
        return "TypeCoercionError";
      case ErrorCode::kConfigurationConflict:
        return "ConfigurationConflictError";
      case ErrorCode::kFileAccess:
        return "FileAccessError";
      case ErrorCode::kKeyFormat:
        return "KeyFormatError";
      case ErrorCode::kUnsupportedAlgorithm:
        return "UnsupportedAlgorithmError";
      case ErrorCode::kEnvelopeDecode:
        return "EnvelopeDecodeError";
      case ErrorCode::kDidResolution:
        return "DidResolutionError";
      case ErrorCode::kSigningFailure:
        return "SigningFailure";
      case ErrorCode::kSignatureVerification:
        return "SignatureVerificationError";
    }
    return "UnknownError";
  }

  std::string SigningError::toString() const {
    return fmt::format("{}: {}", errorCodeName(code), message);
  }

}  // namespace consign
