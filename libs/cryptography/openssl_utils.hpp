/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_OPENSSL_UTILS_HPP
#define CONSIGN_OPENSSL_UTILS_HPP

#include <memory>
#include <string>
#include <string_view>

#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace consign {
  namespace crypto {

    using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;
    using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
    using EcdsaSigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
    using EvpPkeyPtr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
    using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

    inline BioPtr makeMemoryBio() {
      return BioPtr(BIO_new(BIO_s_mem()), &BIO_free);
    }

    /**
     * Describe a failed OpenSSL call, draining the thread error queue.
     * @param what - operation that failed
     */
    inline std::string opensslError(std::string_view what) {
      std::string message(what);
      unsigned long code;
      bool first = true;
      while ((code = ERR_get_error()) != 0) {
        char buffer[256];
        ERR_error_string_n(code, buffer, sizeof(buffer));
        message += first ? ": " : "; ";
        message += buffer;
        first = false;
      }
      return message;
    }

  }  // namespace crypto
}  // namespace consign

#endif  // CONSIGN_OPENSSL_UTILS_HPP
