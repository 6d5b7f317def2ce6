/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>
#include <optional>

#include <gflags/gflags.h>
#include <openssl/crypto.h>
#include "common/result.hpp"
#include "common/version.hpp"
#include "cryptography/algorithm.hpp"
#include "logger/logger.hpp"
#include "logger/logger_manager.hpp"
#include "main/sign_contract_command.hpp"
#include "main/sign_contract_literals.hpp"

static bool validateVerbosity(const char *flagname, const std::string &val) {
  const auto it = config_members::LogLevels.find(val);
  if (it == config_members::LogLevels.end()) {
    std::cerr << "Invalid value for " << flagname << ": should be one of ";
    for (const auto &level : config_members::LogLevels) {
      std::cerr << " '" << level.first << "'";
    }
    std::cerr << "." << std::endl;
    return false;
  }
  return true;
}

static bool validateAlgorithm(const char *flagname, const std::string &val) {
  if (val.empty() or consign::crypto::algorithmFromName(val)) {
    return true;
  }
  std::cerr << "Invalid value for " << flagname << ": should be one of ";
  for (const auto &name : consign::crypto::supportedAlgorithmNames()) {
    std::cerr << " '" << name << "'";
  }
  std::cerr << "." << std::endl;
  return false;
}

/**
 * Inputs
 */
DEFINE_string(contract, "", "Path to contract file");
DEFINE_string(key, "", "Path to PEM-encoded private key");
DEFINE_string(key_passphrase, "", "Pass phrase of an encrypted private key");
DEFINE_string(out,
              "",
              "Output path for the signed contract (expected to end in .cose)");

/**
 * Signing with an existing DID document
 */
DEFINE_string(did_doc, "", "Path to DID document");

/**
 * Ad-hoc signing, without any on-disk document
 */
DEFINE_string(issuer, "", "Issuer stored in envelope header");
DEFINE_string(alg, "", "Signing algorithm to use");
DEFINE_validator(alg, &validateAlgorithm);

DEFINE_string(content_type, "", "Content type of contract");
DEFINE_string(kid, "", "Key ID (\"kid\" field) to use if multiple");
DEFINE_string(feed, "", "Optional \"feed\" stored in envelope header");
DEFINE_bool(add_signature, false, "Add signature to existing contract");

DEFINE_string(verbosity, "info", "Log verbosity");
DEFINE_validator(verbosity, &validateVerbosity);

namespace {
  std::optional<std::string> optionalFlag(const std::string &value) {
    if (value.empty()) {
      return std::nullopt;
    }
    return value;
  }

  /// Overwrite a flag holding a secret, the value is not needed any more.
  void wipeFlag(std::string &value) {
    OPENSSL_cleanse(value.data(), value.size());
    value.clear();
  }
}  // namespace

int main(int argc, char **argv) {
  gflags::SetVersionString(consign::kPrettyVersion);
  gflags::SetUsageMessage(
      "Sign a contract.\n"
      "  sign_contract --contract=<file> --key=<pem> --out=<file.cose> "
      "[flags] [[type:]name=value ...]\n"
      "Positional arguments are registration info entries stored in the "
      "envelope header: type is one of text (default), bytes, int; a value "
      "of the form @file is read from the file.");

  // Parsing command line arguments
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  logger::LoggerConfig cfg;
  cfg.log_level = config_members::LogLevels.at(FLAGS_verbosity);
  logger::LoggerManagerTreePtr log_manager =
      std::make_shared<logger::LoggerManagerTree>(std::move(cfg))
          ->getChild("SignContract");
  logger::LoggerPtr log = log_manager->getLogger();

  for (const auto &[name, value] :
       {std::make_pair("contract", &FLAGS_contract),
        std::make_pair("key", &FLAGS_key),
        std::make_pair("out", &FLAGS_out)}) {
    if (value->empty()) {
      log->error("--{} is required", name);
      ::gflags::ShowUsageWithFlags(argv[0]);
      return EXIT_FAILURE;
    }
  }

  consign::SignContractOptions options;
  options.contract = FLAGS_contract;
  options.key = FLAGS_key;
  options.key_passphrase = optionalFlag(FLAGS_key_passphrase);
  options.out = FLAGS_out;
  options.did_doc = optionalFlag(FLAGS_did_doc);
  options.issuer = optionalFlag(FLAGS_issuer);
  options.algorithm = optionalFlag(FLAGS_alg);
  options.content_type = FLAGS_content_type;
  options.key_id = optionalFlag(FLAGS_kid);
  options.feed = optionalFlag(FLAGS_feed);
  options.add_signature = FLAGS_add_signature;
  // flags were removed from argv, the rest are registration info entries
  options.registration_info.assign(argv + 1, argv + argc);
  wipeFlag(FLAGS_key_passphrase);

  auto result = consign::signContract(options, log_manager);
  if (options.key_passphrase) {
    wipeFlag(*options.key_passphrase);
  }

  return result.match(
      [](const auto &) { return EXIT_SUCCESS; },
      [&log](const auto &error) {
        log->error("Failed to sign the contract: {}", error.error);
        return EXIT_FAILURE;
      });
}
