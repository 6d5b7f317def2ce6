/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/signature_parameters.hpp"

#include <openssl/rsa.h>
#include "common/result.hpp"

namespace consign {
  namespace crypto {

    const EVP_MD *digestFor(Algorithm algorithm) {
      switch (algorithm) {
        case Algorithm::kEs256:
        case Algorithm::kPs256:
          return EVP_sha256();
        case Algorithm::kEs384:
        case Algorithm::kPs384:
          return EVP_sha384();
        case Algorithm::kEs512:
        case Algorithm::kPs512:
          return EVP_sha512();
        case Algorithm::kEdDsa:
          return nullptr;
      }
      return nullptr;
    }

    size_t ecdsaComponentSize(Algorithm algorithm) {
      switch (algorithm) {
        case Algorithm::kEs256:
          return 32;
        case Algorithm::kEs384:
          return 48;
        case Algorithm::kEs512:
          return 66;
        default:
          return 0;
      }
    }

    expected::Result<void, std::string> initDigestContext(EVP_MD_CTX *ctx,
                                                          EVP_PKEY *pkey,
                                                          Algorithm algorithm,
                                                          bool sign) {
      const EVP_MD *md = digestFor(algorithm);
      EVP_PKEY_CTX *pctx = nullptr;
      const int initialized = sign
          ? EVP_DigestSignInit(ctx, &pctx, md, nullptr, pkey)
          : EVP_DigestVerifyInit(ctx, &pctx, md, nullptr, pkey);
      if (initialized != 1) {
        return expected::makeError(
            opensslError(sign ? "EVP_DigestSignInit failed"
                              : "EVP_DigestVerifyInit failed"));
      }
      switch (algorithm) {
        case Algorithm::kPs256:
        case Algorithm::kPs384:
        case Algorithm::kPs512:
          if (EVP_PKEY_CTX_set_rsa_padding(pctx, RSA_PKCS1_PSS_PADDING) != 1
              or EVP_PKEY_CTX_set_rsa_pss_saltlen(pctx, RSA_PSS_SALTLEN_DIGEST)
                  != 1
              or EVP_PKEY_CTX_set_rsa_mgf1_md(pctx, md) != 1) {
            return expected::makeError(
                opensslError("Unable to configure RSASSA-PSS"));
          }
          break;
        default:
          break;
      }
      return {};
    }

  }  // namespace crypto
}  // namespace consign
