/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_SIGN_CONTRACT_LITERALS_HPP
#define CONSIGN_SIGN_CONTRACT_LITERALS_HPP

#include <string>
#include <unordered_map>

#include "logger/logger.hpp"

namespace config_members {
  extern const std::unordered_map<std::string, logger::LogLevel> LogLevels;
  /// Extension the signed envelope file is expected to have
  extern const char *EnvelopeExtension;
}  // namespace config_members

#endif  // CONSIGN_SIGN_CONTRACT_LITERALS_HPP
