/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_LOGGER_LOGGER_FWD_HPP
#define CONSIGN_LOGGER_LOGGER_FWD_HPP

#include <memory>

namespace logger {

  enum class LogLevel;

  class Logger;

  using LoggerPtr = std::shared_ptr<const Logger>;

}  // namespace logger

#endif  // CONSIGN_LOGGER_LOGGER_FWD_HPP
