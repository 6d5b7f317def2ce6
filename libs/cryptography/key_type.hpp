/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_KEY_TYPE_HPP
#define CONSIGN_KEY_TYPE_HPP

#include <string>

#include <openssl/evp.h>
#include "common/result_fwd.hpp"

namespace consign {
  namespace crypto {

    /// Asymmetric key types that can sign a contract
    enum class KeyType {
      kEcP256,
      kEcP384,
      kEcP521,
      kRsa,
      kEd25519,
    };

    /// @return human readable key type, e.g. "EC P-256"
    std::string keyTypeName(KeyType type);

    /**
     * Determine the key type of an OpenSSL key.
     * @return key type or error for key types that cannot be used
     */
    expected::Result<KeyType, std::string> determineKeyType(
        const EVP_PKEY *pkey);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_KEY_TYPE_HPP
