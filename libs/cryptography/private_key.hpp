/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_PRIVATE_KEY_HPP
#define CONSIGN_PRIVATE_KEY_HPP

#include <optional>
#include <string>
#include <string_view>

#include "common/result_fwd.hpp"
#include "cryptography/key_type.hpp"
#include "cryptography/openssl_utils.hpp"
#include "cryptography/public_key.hpp"

namespace consign {
  namespace crypto {

    /**
     * A special class for holding a private signing key. The key material
     * stays inside OpenSSL, the object can be moved but not copied, and
     * toString() never reveals anything but the key type.
     */
    class PrivateKey {
     public:
      PrivateKey(PrivateKey &&) = default;
      PrivateKey &operator=(PrivateKey &&) = default;
      PrivateKey(const PrivateKey &) = delete;
      PrivateKey &operator=(const PrivateKey &) = delete;

      /**
       * Decode a PEM private key (PKCS#8 or traditional format).
       * @param pem - PEM text
       * @param pass_phrase - used to decrypt an encrypted key
       * @return key or error if the text is not a usable private key
       */
      static expected::Result<PrivateKey, std::string> fromPem(
          std::string_view pem,
          const std::optional<std::string> &pass_phrase);

      /// Take ownership of an OpenSSL key after checking its type.
      static expected::Result<PrivateKey, std::string> fromEvpPkey(
          EvpPkeyPtr pkey);

      KeyType type() const;

      /// Underlying OpenSSL key, owned by this object
      EVP_PKEY *get() const;

      /// Public half of the key
      PublicKey publicKey() const;

      /**
       * Encode as PKCS#8 PEM.
       * @param pass_phrase - if given, the key is encrypted with AES-256-CBC
       */
      expected::Result<std::string, std::string> toPem(
          const std::optional<std::string> &pass_phrase) const;

      std::string toString() const;

     private:
      PrivateKey(EvpPkeyPtr pkey, KeyType type);

      EvpPkeyPtr pkey_;
      KeyType type_;
    };

    /**
     * Decode PEM text into an OpenSSL key without checking its type.
     * @param pem - PEM text
     * @param pass_phrase - used to decrypt an encrypted key
     */
    expected::Result<EvpPkeyPtr, std::string> decodePemPrivateKey(
        std::string_view pem, const std::optional<std::string> &pass_phrase);

    /// Generate a fresh key, RSA keys are 2048 bits.
    expected::Result<PrivateKey, std::string> generatePrivateKey(KeyType type);

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_PRIVATE_KEY_HPP
