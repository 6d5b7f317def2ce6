/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_DID_DOCUMENT_HPP
#define CONSIGN_DID_DOCUMENT_HPP

#include <optional>
#include <string>
#include <vector>

#include "common/result_fwd.hpp"
#include "cryptography/jwk.hpp"

namespace consign {

  struct VerificationMethod {
    /// absolute id, "did:...#fragment"
    std::string id;
    std::string type;
    std::optional<std::string> controller;
    std::optional<crypto::Jwk> public_key_jwk;
  };

  /**
   * The parts of a DID document (W3C DID Core) needed to sign: the subject
   * id and the methods it authorizes for assertions.
   */
  struct DidDocument {
    std::string id;
    std::vector<VerificationMethod> verification_methods;
    /// assertionMethod entries, string references already resolved
    std::vector<VerificationMethod> assertion_methods;
  };

  /**
   * Parse DID document JSON.
   * @param text - JSON text
   * @return document or error describing the syntax or structure problem
   */
  expected::Result<DidDocument, std::string> parseDidDocument(
      const std::string &text);

}  // namespace consign

#endif  // CONSIGN_DID_DOCUMENT_HPP
