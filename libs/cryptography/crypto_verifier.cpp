/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/crypto_verifier.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "cryptography/ecdsa_signature.hpp"
#include "cryptography/public_key.hpp"
#include "cryptography/signature_parameters.hpp"

namespace consign {
  namespace crypto {

    expected::Result<void, std::string> CryptoVerifier::verify(
        ByteRange signature,
        ByteRange message,
        const PublicKey &key,
        Algorithm algorithm) {
      if (not isCompatible(algorithm, key.type())) {
        return expected::makeError(
            fmt::format("algorithm {} cannot be used with {} key",
                        algorithmName(algorithm),
                        keyTypeName(key.type())));
      }

      Bytes encoded = toBytes(signature);
      if (auto component_size = ecdsaComponentSize(algorithm)) {
        CONSIGN_EXPECTED_TRY_GET_VALUE(
            der, ecdsaRawToDer(signature, component_size));
        encoded = std::move(der);
      }

      EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (ctx == nullptr) {
        return expected::makeError(opensslError("EVP_MD_CTX_new failed"));
      }
      CONSIGN_EXPECTED_ERROR_CHECK(
          initDigestContext(ctx.get(), key.get(), algorithm, false));

      const int verified = EVP_DigestVerify(ctx.get(),
                                            encoded.data(),
                                            encoded.size(),
                                            rangeData(message),
                                            message.size());
      if (verified != 1) {
        // clear the queue, a mismatch is reported as plain bad signature
        ERR_clear_error();
        return expected::makeError(std::string{"Bad signature."});
      }
      return {};
    }

  }  // namespace crypto
}  // namespace consign
