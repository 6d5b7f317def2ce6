/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_KEY_LOADER_HPP
#define CONSIGN_KEY_LOADER_HPP

#include <optional>
#include <string>

#include <boost/filesystem/path.hpp>
#include "common/result_fwd.hpp"
#include "cryptography/private_key.hpp"
#include "logger/logger_fwd.hpp"

namespace consign {

  /// Reason a private key could not be loaded
  struct KeyLoadError {
    enum class Kind {
      kFileAccess,
      kKeyFormat,
      kUnsupportedKeyType,
    };

    Kind kind;
    std::string message;

    std::string toString() const;
  };

  /**
   * Loads PEM private keys from disk.
   */
  class KeyLoader {
   public:
    /**
     * @param log to print progress
     */
    explicit KeyLoader(logger::LoggerPtr log);

    /**
     * Load a private key and check that it can sign contracts.
     * @param path - PEM file with a PKCS#8 or traditional private key
     * @param pass_phrase (optional) is used to decrypt the private key
     * @return the key, or error telling whether the file could not be read,
     * could not be decoded or holds an unsupported key type
     */
    expected::Result<crypto::PrivateKey, KeyLoadError> loadPrivateKey(
        const boost::filesystem::path &path,
        const std::optional<std::string> &pass_phrase) const;

   private:
    logger::LoggerPtr log_;
  };

}  // namespace consign

#endif  // CONSIGN_KEY_LOADER_HPP
