/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "cryptography/private_key.hpp"

#include <algorithm>
#include <cstring>
#include <limits>

#include <fmt/core.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include "common/result.hpp"

namespace {
  /**
   * PEM pass phrase callback. A null pass phrase makes OpenSSL fail on
   * encrypted keys instead of prompting on the terminal.
   */
  int passPhraseCallback(char *buffer, int size, int, void *user_data) {
    const auto *pass_phrase = static_cast<const std::string *>(user_data);
    if (pass_phrase == nullptr or size <= 0) {
      return -1;
    }
    const auto length = static_cast<int>(
        std::min(pass_phrase->size(), static_cast<size_t>(size)));
    std::memcpy(buffer, pass_phrase->data(), static_cast<size_t>(length));
    return length;
  }
}  // namespace

namespace consign {
  namespace crypto {

    PrivateKey::PrivateKey(EvpPkeyPtr pkey, KeyType type)
        : pkey_(std::move(pkey)), type_(type) {}

    expected::Result<PrivateKey, std::string> PrivateKey::fromPem(
        std::string_view pem, const std::optional<std::string> &pass_phrase) {
      return decodePemPrivateKey(pem, pass_phrase) |
          [](EvpPkeyPtr &&pkey) { return fromEvpPkey(std::move(pkey)); };
    }

    expected::Result<PrivateKey, std::string> PrivateKey::fromEvpPkey(
        EvpPkeyPtr pkey) {
      auto type = determineKeyType(pkey.get());
      if (auto error = expected::resultToOptionalError(type)) {
        return expected::makeError(std::move(*error));
      }
      return expected::makeValue(
          PrivateKey(std::move(pkey), std::move(type).assumeValue()));
    }

    KeyType PrivateKey::type() const {
      return type_;
    }

    EVP_PKEY *PrivateKey::get() const {
      return pkey_.get();
    }

    PublicKey PrivateKey::publicKey() const {
      EVP_PKEY_up_ref(pkey_.get());
      // the shared object carries the private part too, PublicKey only ever
      // uses the public operations on it
      return PublicKey(std::shared_ptr<EVP_PKEY>(pkey_.get(), &EVP_PKEY_free),
                       type_);
    }

    expected::Result<std::string, std::string> PrivateKey::toPem(
        const std::optional<std::string> &pass_phrase) const {
      auto bio = makeMemoryBio();
      if (not bio) {
        return expected::makeError(opensslError("Unable to allocate buffer"));
      }
      const int written = pass_phrase
          ? PEM_write_bio_PKCS8PrivateKey(
                bio.get(),
                pkey_.get(),
                EVP_aes_256_cbc(),
                pass_phrase->data(),
                static_cast<int>(pass_phrase->size()),
                nullptr,
                nullptr)
          : PEM_write_bio_PrivateKey(
                bio.get(), pkey_.get(), nullptr, nullptr, 0, nullptr, nullptr);
      if (written != 1) {
        return expected::makeError(
            opensslError("Unable to encode private key"));
      }
      char *data = nullptr;
      const long length = BIO_get_mem_data(bio.get(), &data);
      return expected::makeValue(
          std::string(data, static_cast<size_t>(length)));
    }

    std::string PrivateKey::toString() const {
      return fmt::format("PrivateKey: [{}]", keyTypeName(type_));
    }

    expected::Result<EvpPkeyPtr, std::string> decodePemPrivateKey(
        std::string_view pem, const std::optional<std::string> &pass_phrase) {
      if (pem.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        return expected::makeError(std::string{"Private key too large."});
      }
      auto bio = makeMemoryBio();
      if (not bio
          or BIO_write(bio.get(), pem.data(), static_cast<int>(pem.size()))
              != static_cast<int>(pem.size())) {
        return expected::makeError(
            opensslError("Unable to buffer private key"));
      }
      EvpPkeyPtr pkey(
          PEM_read_bio_PrivateKey(
              bio.get(),
              nullptr,
              &passPhraseCallback,
              const_cast<std::string *>(pass_phrase ? &*pass_phrase : nullptr)),
          &EVP_PKEY_free);
      if (pkey == nullptr) {
        return expected::makeError(opensslError(
            pass_phrase ? "Unable to decrypt private key with the given "
                          "pass phrase"
                        : "Unable to parse private key"));
      }
      return expected::makeValue(std::move(pkey));
    }

    expected::Result<PrivateKey, std::string> generatePrivateKey(KeyType type) {
      EVP_PKEY *raw = nullptr;
      switch (type) {
        case KeyType::kEcP256:
          raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-256");
          break;
        case KeyType::kEcP384:
          raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-384");
          break;
        case KeyType::kEcP521:
          raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "EC", "P-521");
          break;
        case KeyType::kRsa:
          raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", size_t{2048});
          break;
        case KeyType::kEd25519:
          raw = EVP_PKEY_Q_keygen(nullptr, nullptr, "ED25519");
          break;
      }
      if (raw == nullptr) {
        return expected::makeError(opensslError(
            fmt::format("Unable to generate {} key", keyTypeName(type))));
      }
      return PrivateKey::fromEvpPkey(EvpPkeyPtr(raw, &EVP_PKEY_free));
    }

  }  // namespace crypto
}  // namespace consign
