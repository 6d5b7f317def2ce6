/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_JWK_HPP
#define CONSIGN_JWK_HPP

#include <optional>
#include <string>

#include "common/result_fwd.hpp"

namespace consign {
  namespace crypto {

    class PublicKey;

    /// Public JSON Web Key members relevant for signing keys (RFC 7517/7518)
    struct Jwk {
      std::string kty;
      std::optional<std::string> crv;
      std::optional<std::string> x;
      std::optional<std::string> y;
      std::optional<std::string> n;
      std::optional<std::string> e;
      std::optional<std::string> alg;
    };

    /**
     * Describe a public key as a JWK. The alg member is left empty.
     * @return "EC", "RSA" or "OKP" key
     */
    expected::Result<Jwk, std::string> toJwk(const PublicKey &key);

    /**
     * Check that a JWK describes the given public key. Coordinates are
     * compared after base64url decoding, RSA integers ignoring leading
     * zero bytes.
     */
    bool jwkMatchesKey(const Jwk &jwk, const PublicKey &key);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_JWK_HPP
