/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_PUBLIC_KEY_HPP
#define CONSIGN_PUBLIC_KEY_HPP

#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>
#include "common/result_fwd.hpp"
#include "cryptography/key_type.hpp"

namespace consign {
  namespace crypto {

    /**
     * Public half of a signing key. Copies share the underlying OpenSSL
     * object, which is never modified after construction.
     */
    class PublicKey {
     public:
      /**
       * Parse a PEM encoded SubjectPublicKeyInfo.
       * @param pem - "-----BEGIN PUBLIC KEY-----" block
       */
      static expected::Result<PublicKey, std::string> fromPem(
          std::string_view pem);

      KeyType type() const;

      /// Underlying OpenSSL key, owned by this object
      EVP_PKEY *get() const;

      expected::Result<std::string, std::string> toPem() const;

      /// @return true when both keys hold the same public parameters
      bool operator==(const PublicKey &other) const;

      std::string toString() const;

     private:
      friend class PrivateKey;

      PublicKey(std::shared_ptr<EVP_PKEY> pkey, KeyType type);

      std::shared_ptr<EVP_PKEY> pkey_;
      KeyType type_;
    };

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_PUBLIC_KEY_HPP
