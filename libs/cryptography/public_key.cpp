/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/public_key.hpp"

#include <limits>

#include <fmt/core.h>
#include <openssl/pem.h>
#include "common/result.hpp"
#include "cryptography/openssl_utils.hpp"

namespace consign {
  namespace crypto {

    PublicKey::PublicKey(std::shared_ptr<EVP_PKEY> pkey, KeyType type)
        : pkey_(std::move(pkey)), type_(type) {}

    expected::Result<PublicKey, std::string> PublicKey::fromPem(
        std::string_view pem) {
      if (pem.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return expected::makeError(std::string{"Public key too large."});
      }
      auto bio = makeMemoryBio();
      if (not bio
          or BIO_write(bio.get(), pem.data(), static_cast<int>(pem.size()))
              != static_cast<int>(pem.size())) {
        return expected::makeError(opensslError("Unable to buffer public key"));
      }
      std::shared_ptr<EVP_PKEY> pkey(
          PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr),
          &EVP_PKEY_free);
      if (pkey == nullptr) {
        return expected::makeError(opensslError("Unable to parse public key"));
      }
      return determineKeyType(pkey.get()) | [&pkey](auto type) {
        return PublicKey(std::move(pkey), type);
      };
    }

    KeyType PublicKey::type() const {
      return type_;
    }

    EVP_PKEY *PublicKey::get() const {
      return pkey_.get();
    }

    expected::Result<std::string, std::string> PublicKey::toPem() const {
      auto bio = makeMemoryBio();
      if (not bio or PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != 1) {
        return expected::makeError(opensslError("Unable to encode public key"));
      }
      char *data = nullptr;
      const long length = BIO_get_mem_data(bio.get(), &data);
      return expected::makeValue(
          std::string(data, static_cast<size_t>(length)));
    }

    bool PublicKey::operator==(const PublicKey &other) const {
      return EVP_PKEY_eq(pkey_.get(), other.pkey_.get()) == 1;
    }

    std::string PublicKey::toString() const {
      return fmt::format("PublicKey: [{}]", keyTypeName(type_));
    }

  }  // namespace crypto
}  // namespace consign
