/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/ecdsa_signature.hpp"

#include <limits>

#include <fmt/core.h>
#include "common/result.hpp"
#include "cryptography/openssl_utils.hpp"

namespace consign {
  namespace crypto {

    expected::Result<Bytes, std::string> ecdsaDerToRaw(ByteRange der,
                                                       size_t component_size) {
      if (der.size() > static_cast<size_t>(std::numeric_limits<long>::max())) {
        return expected::makeError(std::string{"ECDSA signature too large"});
      }
      const unsigned char *cursor = rangeData(der);
      EcdsaSigPtr sig(
          d2i_ECDSA_SIG(nullptr, &cursor, static_cast<long>(der.size())),
          &ECDSA_SIG_free);
      if (sig == nullptr) {
        return expected::makeError(
            opensslError("Unable to decode ECDSA signature"));
      }
      const BIGNUM *r = nullptr;
      const BIGNUM *s = nullptr;
      ECDSA_SIG_get0(sig.get(), &r, &s);

      Bytes raw(component_size * 2);
      if (BN_bn2binpad(r, raw.data(), static_cast<int>(component_size)) < 0
          or BN_bn2binpad(
                 s, raw.data() + component_size, static_cast<int>(component_size))
              < 0) {
        return expected::makeError(fmt::format(
            "ECDSA signature component exceeds {} bytes", component_size));
      }
      return expected::makeValue(std::move(raw));
    }

    expected::Result<Bytes, std::string> ecdsaRawToDer(ByteRange raw,
                                                       size_t component_size) {
      if (raw.size() != component_size * 2) {
        return expected::makeError(
            fmt::format("ECDSA signature must be {} bytes long, got {}",
                        component_size * 2,
                        raw.size()));
      }
      BignumPtr r(BN_bin2bn(rangeData(raw), static_cast<int>(component_size),
                            nullptr),
                  &BN_free);
      BignumPtr s(BN_bin2bn(rangeData(raw) + component_size,
                            static_cast<int>(component_size),
                            nullptr),
                  &BN_free);
      EcdsaSigPtr sig(ECDSA_SIG_new(), &ECDSA_SIG_free);
      if (r == nullptr or s == nullptr or sig == nullptr) {
        return expected::makeError(
            opensslError("Unable to allocate ECDSA signature"));
      }
      if (ECDSA_SIG_set0(sig.get(), r.get(), s.get()) != 1) {
        return expected::makeError(
            opensslError("Unable to assemble ECDSA signature"));
      }
      // ownership moved into sig
      r.release();
      s.release();

      unsigned char *der = nullptr;
      const int length = i2d_ECDSA_SIG(sig.get(), &der);
      if (length <= 0) {
        return expected::makeError(
            opensslError("Unable to encode ECDSA signature"));
      }
      Bytes result(der, der + length);
      OPENSSL_free(der);
      return expected::makeValue(std::move(result));
    }

  }  // namespace crypto
}  // namespace consign
