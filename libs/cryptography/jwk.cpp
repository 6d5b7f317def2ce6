/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/jwk.hpp"

#include <algorithm>

#include <openssl/core_names.h>
#include "common/result.hpp"
#include "common/result_try.hpp"
#include "cryptography/base64url.hpp"
#include "cryptography/openssl_utils.hpp"
#include "cryptography/public_key.hpp"

namespace {
  using namespace consign;
  using namespace consign::crypto;

  expected::Result<Bytes, std::string> bignumParam(const EVP_PKEY *pkey,
                                                   const char *name,
                                                   size_t width) {
    BIGNUM *raw = nullptr;
    if (EVP_PKEY_get_bn_param(pkey, name, &raw) != 1) {
      return expected::makeError(
          opensslError(std::string{"Unable to read key parameter "} + name));
    }
    BignumPtr bn(raw, &BN_free);
    const size_t size =
        width != 0 ? width : static_cast<size_t>(BN_num_bytes(bn.get()));
    Bytes bytes(size);
    if (BN_bn2binpad(bn.get(), bytes.data(), static_cast<int>(size)) < 0) {
      return expected::makeError(
          std::string{"Key parameter does not fit: "} + name);
    }
    return expected::makeValue(std::move(bytes));
  }

  std::string encode(const Bytes &bytes) {
    return base64UrlEncode(makeByteRange(bytes));
  }

  const char *curveName(KeyType type) {
    switch (type) {
      case KeyType::kEcP256:
        return "P-256";
      case KeyType::kEcP384:
        return "P-384";
      case KeyType::kEcP521:
        return "P-521";
      case KeyType::kEd25519:
        return "Ed25519";
      default:
        return nullptr;
    }
  }

  size_t coordinateSize(KeyType type) {
    switch (type) {
      case KeyType::kEcP256:
        return 32;
      case KeyType::kEcP384:
        return 48;
      default:
        return 66;
    }
  }

  std::optional<Bytes> decodeMember(const std::optional<std::string> &member,
                                    bool strip_leading_zeros) {
    if (not member) {
      return std::nullopt;
    }
    auto decoded = expected::resultToOptionalValue(base64UrlDecode(*member));
    if (decoded and strip_leading_zeros) {
      auto first = std::find_if(
          decoded->begin(), decoded->end(), [](auto b) { return b != 0; });
      decoded->erase(decoded->begin(), first);
    }
    return decoded;
  }

  bool sameMember(const std::optional<std::string> &lhs,
                  const std::optional<std::string> &rhs,
                  bool strip_leading_zeros = false) {
    auto l = decodeMember(lhs, strip_leading_zeros);
    auto r = decodeMember(rhs, strip_leading_zeros);
    return l and r and *l == *r;
  }
}  // namespace

namespace consign {
  namespace crypto {

    expected::Result<Jwk, std::string> toJwk(const PublicKey &key) {
      Jwk jwk;
      switch (key.type()) {
        case KeyType::kEcP256:
        case KeyType::kEcP384:
        case KeyType::kEcP521: {
          const auto size = coordinateSize(key.type());
          CONSIGN_EXPECTED_TRY_GET_VALUE(
              x, bignumParam(key.get(), OSSL_PKEY_PARAM_EC_PUB_X, size));
          CONSIGN_EXPECTED_TRY_GET_VALUE(
              y, bignumParam(key.get(), OSSL_PKEY_PARAM_EC_PUB_Y, size));
          jwk.kty = "EC";
          jwk.crv = curveName(key.type());
          jwk.x = encode(x);
          jwk.y = encode(y);
          break;
        }
        case KeyType::kRsa: {
          CONSIGN_EXPECTED_TRY_GET_VALUE(
              n, bignumParam(key.get(), OSSL_PKEY_PARAM_RSA_N, 0));
          CONSIGN_EXPECTED_TRY_GET_VALUE(
              e, bignumParam(key.get(), OSSL_PKEY_PARAM_RSA_E, 0));
          jwk.kty = "RSA";
          jwk.n = encode(n);
          jwk.e = encode(e);
          break;
        }
        case KeyType::kEd25519: {
          Bytes raw(32);
          size_t length = raw.size();
          if (EVP_PKEY_get_raw_public_key(key.get(), raw.data(), &length)
              != 1) {
            return expected::makeError(
                opensslError("Unable to read Ed25519 public key"));
          }
          raw.resize(length);
          jwk.kty = "OKP";
          jwk.crv = curveName(key.type());
          jwk.x = encode(raw);
          break;
        }
      }
      return expected::makeValue(std::move(jwk));
    }

    bool jwkMatchesKey(const Jwk &jwk, const PublicKey &key) {
      auto own = expected::resultToOptionalValue(toJwk(key));
      if (not own or own->kty != jwk.kty) {
        return false;
      }
      if (own->kty == "RSA") {
        return sameMember(own->n, jwk.n, true)
            and sameMember(own->e, jwk.e, true);
      }
      if (own->crv != jwk.crv or not sameMember(own->x, jwk.x)) {
        return false;
      }
      return own->kty != "EC" or sameMember(own->y, jwk.y);
    }

  }  // namespace crypto
}  // namespace consign
