/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGNER_HPP
#define CONSIGN_SIGNER_HPP

#include <optional>
#include <string>

#include "cryptography/algorithm.hpp"
#include "cryptography/private_key.hpp"

namespace consign {

  /**
   * Signing capability for one invocation: the private key together with
   * the identity placed into the signature header.
   */
  struct Signer {
    crypto::PrivateKey key;
    std::optional<std::string> issuer;
    std::optional<std::string> key_id;
    /// inferred from the key type when absent
    std::optional<crypto::Algorithm> algorithm;

    /// Algorithm actually used for signing
    crypto::Algorithm effectiveAlgorithm() const {
      return algorithm ? *algorithm : crypto::inferAlgorithm(key.type());
    }

    std::string toString() const;
  };

}  // namespace consign

#endif  // CONSIGN_SIGNER_HPP
