/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "crypto/key_loader.hpp"

#include <fmt/core.h>
#include <openssl/crypto.h>
#include "common/files.hpp"
#include "common/result.hpp"
#include "logger/logger.hpp"

namespace consign {

  std::string KeyLoadError::toString() const {
    return message;
  }

  KeyLoader::KeyLoader(logger::LoggerPtr log) : log_(std::move(log)) {}

  expected::Result<crypto::PrivateKey, KeyLoadError> KeyLoader::loadPrivateKey(
      const boost::filesystem::path &path,
      const std::optional<std::string> &pass_phrase) const {
    using ReturnType = expected::Result<crypto::PrivateKey, KeyLoadError>;

    log_->debug("Loading private key from {}", path.string());
    auto pem = readTextFile(path);
    if (auto error = expected::resultToOptionalError(pem)) {
      return expected::makeError(
          KeyLoadError{KeyLoadError::Kind::kFileAccess, std::move(*error)});
    }
    auto &pem_text = pem.assumeValue();
    auto pkey = crypto::decodePemPrivateKey(pem_text, pass_phrase);
    OPENSSL_cleanse(pem_text.data(), pem_text.size());

    return std::move(pkey).match(
        [this, &path](auto &&decoded) -> ReturnType {
          return crypto::PrivateKey::fromEvpPkey(std::move(decoded.value))
              .match(
                  [this](auto &&key) -> ReturnType {
                    log_->info("Loaded {}", key.value.toString());
                    return expected::makeValue(std::move(key.value));
                  },
                  [&path](auto &&error) -> ReturnType {
                    return expected::makeError(KeyLoadError{
                        KeyLoadError::Kind::kUnsupportedKeyType,
                        fmt::format("Key in '{}' cannot sign contracts: {}",
                                    path.string(),
                                    error.error)});
                  });
        },
        [&path](auto &&error) -> ReturnType {
          return expected::makeError(
              KeyLoadError{KeyLoadError::Kind::kKeyFormat,
                           fmt::format("File '{}' is not a usable private "
                                       "key: {}",
                                       path.string(),
                                       error.error)});
        });
  }

}  // namespace consign
