/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/crypto_signer.hpp"

#include <fmt/core.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "cryptography/ecdsa_signature.hpp"
#include "cryptography/private_key.hpp"
#include "cryptography/signature_parameters.hpp"

namespace consign {
  namespace crypto {

    expected::Result<Bytes, std::string> CryptoSigner::sign(
        ByteRange message, const PrivateKey &key, Algorithm algorithm) {
      if (not isCompatible(algorithm, key.type())) {
        return expected::makeError(
            fmt::format("algorithm {} cannot be used with {} key",
                        algorithmName(algorithm),
                        keyTypeName(key.type())));
      }
      EvpMdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
      if (ctx == nullptr) {
        return expected::makeError(opensslError("EVP_MD_CTX_new failed"));
      }
      CONSIGN_EXPECTED_ERROR_CHECK(
          initDigestContext(ctx.get(), key.get(), algorithm, true));

      size_t length = 0;
      if (EVP_DigestSign(
              ctx.get(), nullptr, &length, rangeData(message), message.size())
          != 1) {
        return expected::makeError(opensslError("EVP_DigestSign failed"));
      }
      Bytes signature(length);
      if (EVP_DigestSign(ctx.get(),
                         signature.data(),
                         &length,
                         rangeData(message),
                         message.size())
          != 1) {
        return expected::makeError(opensslError("EVP_DigestSign failed"));
      }
      signature.resize(length);

      if (auto component_size = ecdsaComponentSize(algorithm)) {
        return ecdsaDerToRaw(makeByteRange(signature), component_size);
      }
      return expected::makeValue(std::move(signature));
    }

  }  // namespace crypto
}  // namespace consign
