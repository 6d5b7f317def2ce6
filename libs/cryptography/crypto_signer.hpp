/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_CRYPTO_SIGNER_HPP
#define CONSIGN_CRYPTO_SIGNER_HPP

#include <string>

#include "common/byte_range.hpp"
#include "common/result_fwd.hpp"
#include "cryptography/algorithm.hpp"

namespace consign {
  namespace crypto {

    class PrivateKey;

    /**
     * CryptoSigner - produces signatures in the encoding COSE expects for
     * each algorithm
     */
    class CryptoSigner {
     public:
      /**
       * Generate signature for target data
       * @param message - data for signing
       * @param key - private key, must be compatible with the algorithm
       * @param algorithm - signature algorithm
       * @return raw signature: r || s for ECDSA, the RSASSA-PSS signature
       * or the 64 byte Ed25519 signature
       */
      static expected::Result<Bytes, std::string> sign(ByteRange message,
                                                       const PrivateKey &key,
                                                       Algorithm algorithm);

      /// close constructor for forbidding instantiation
      CryptoSigner() = delete;
    };

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_CRYPTO_SIGNER_HPP
