/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGN_CONTRACT_COMMAND_HPP
#define CONSIGN_SIGN_CONTRACT_COMMAND_HPP

#include <optional>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>
#include "common/result_fwd.hpp"
#include "error/signing_error.hpp"
#include "logger/logger_manager_fwd.hpp"

namespace consign {

  /// Options of one sign_contract invocation
  struct SignContractOptions {
    boost::filesystem::path contract;
    boost::filesystem::path key;
    std::optional<std::string> key_passphrase;
    boost::filesystem::path out;
    std::optional<std::string> did_doc;
    std::optional<std::string> issuer;
    std::optional<std::string> algorithm;
    std::string content_type;
    std::optional<std::string> key_id;
    std::optional<std::string> feed;
    bool add_signature{false};
    /// raw "[type:]name=content" entries
    std::vector<std::string> registration_info;
  };

  /**
   * Sign a contract file and write the envelope. Steps run in order: option
   * conflict check, key load, DID document load, signer construction,
   * registration info parsing, contract read, signing, output write. The
   * output file is written atomically and only when every step succeeded.
   * @param options - invocation options
   * @param log_manager - parent of the loggers used by the steps
   */
  expected::Result<void, SigningError> signContract(
      const SignContractOptions &options,
      logger::LoggerManagerTreePtr log_manager);

}  // namespace consign

#endif  // CONSIGN_SIGN_CONTRACT_COMMAND_HPP
