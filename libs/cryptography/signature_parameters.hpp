/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGNATURE_PARAMETERS_HPP
#define CONSIGN_SIGNATURE_PARAMETERS_HPP

#include <string>

#include <openssl/evp.h>
#include "common/result_fwd.hpp"
#include "cryptography/algorithm.hpp"
#include "cryptography/openssl_utils.hpp"

namespace consign {
  namespace crypto {

    /// Digest used by the algorithm, nullptr for EdDSA which hashes itself
    const EVP_MD *digestFor(Algorithm algorithm);

    /// Size of each ECDSA signature component, 0 for other algorithms
    size_t ecdsaComponentSize(Algorithm algorithm);

    /**
     * Initialize a digest sign or verify context for the algorithm,
     * selecting PSS padding with MGF1 and salt of digest length for RSA.
     * @param sign - true for signing, false for verification
     */
    expected::Result<void, std::string> initDigestContext(EVP_MD_CTX *ctx,
                                  EVP_PKEY *pkey,
                                  Algorithm algorithm,
                                  bool sign);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_SIGNATURE_PARAMETERS_HPP
