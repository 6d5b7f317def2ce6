/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_CRYPTO_VERIFIER_HPP
#define CONSIGN_CRYPTO_VERIFIER_HPP

#include <string>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "cryptography/algorithm.hpp"

namespace consign {
  namespace crypto {

    class PublicKey;

    /**
     * CryptoVerifier - checks signatures produced by CryptoSigner
     */
    class CryptoVerifier {
     public:
      /**
       * Verify signature attached to source data
       * @param signature - raw signature in COSE encoding
       * @param message - data that was signed
       * @param key - public key of the signer
       * @param algorithm - signature algorithm
       * @return a result of void if signature is correct or error message
       * otherwise or if verification could not be completed
       */
      static expected::Result<void, std::string> verify(ByteRange signature,
                                                        ByteRange message,
                                                        const PublicKey &key,
                                                        Algorithm algorithm);

      /// close constructor for forbidding instantiation
      CryptoVerifier() = delete;
    };

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_CRYPTO_VERIFIER_HPP
