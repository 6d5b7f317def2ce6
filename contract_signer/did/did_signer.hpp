/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_DID_SIGNER_HPP
#define CONSIGN_DID_SIGNER_HPP

#include <optional>
#include <string>

#include "common/result_fwd.hpp"
#include "did/did_document.hpp"
#include "error/signing_error.hpp"
#include "signing/signer.hpp"

namespace consign {

  /**
   * Build a signer whose identity comes from a DID document.
   * @param key - private key, must match the selected method's publicKeyJwk
   * @param document - DID document of the issuer
   * @param key_id - selects an assertion method by id, absolute, "#fragment"
   * or bare fragment; required when several methods could match the key
   * @return signer with issuer = document id, key id = method id relative to
   * the document, algorithm from the JWK "alg" member when present
   */
  expected::Result<Signer, SigningError> resolveSignerFromDid(
      crypto::PrivateKey key,
      const DidDocument &document,
      const std::optional<std::string> &key_id);

}  // namespace consign

#endif  // CONSIGN_DID_SIGNER_HPP
