/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/key_type.hpp"

#include <fmt/core.h>
#include <openssl/core_names.h>
#include "common/result.hpp"

namespace consign {
  namespace crypto {

    std::string keyTypeName(KeyType type) {
      switch (type) {
        case KeyType::kEcP256:
          return "EC P-256";
        case KeyType::kEcP384:
          return "EC P-384";
        case KeyType::kEcP521:
          return "EC P-521";
        case KeyType::kRsa:
          return "RSA";
        case KeyType::kEd25519:
          return "Ed25519";
      }
      return "unknown";
    }

    expected::Result<KeyType, std::string> determineKeyType(
        const EVP_PKEY *pkey) {
      if (pkey == nullptr) {
        return expected::makeError(std::string{"no key"});
      }
      switch (EVP_PKEY_get_base_id(pkey)) {
        case EVP_PKEY_RSA:
          return expected::makeValue(KeyType::kRsa);
        case EVP_PKEY_ED25519:
          return expected::makeValue(KeyType::kEd25519);
        case EVP_PKEY_EC: {
          char group[64] = {};
          size_t length = 0;
          if (EVP_PKEY_get_utf8_string_param(pkey,
                                             OSSL_PKEY_PARAM_GROUP_NAME,
                                             group,
                                             sizeof(group),
                                             &length)
              != 1) {
            return expected::makeError(
                std::string{"EC key without a named curve"});
          }
          const std::string name(group, length);
          if (name == "prime256v1" or name == "P-256") {
            return expected::makeValue(KeyType::kEcP256);
          }
          if (name == "secp384r1" or name == "P-384") {
            return expected::makeValue(KeyType::kEcP384);
          }
          if (name == "secp521r1" or name == "P-521") {
            return expected::makeValue(KeyType::kEcP521);
          }
          return expected::makeError(
              fmt::format("unsupported elliptic curve '{}'", name));
        }
        default:
          return expected::makeError(
              fmt::format("unsupported key type '{}'",
                          EVP_PKEY_get0_type_name(pkey) != nullptr
                              ? EVP_PKEY_get0_type_name(pkey)
                              : "unknown"));
      }
    }

  }  // namespace crypto
}  // namespace consign
