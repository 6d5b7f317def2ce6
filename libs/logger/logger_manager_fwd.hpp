/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_LOGGER_LOGGER_MANAGER_FWD_HPP
#define CONSIGN_LOGGER_LOGGER_MANAGER_FWD_HPP

#include <memory>

namespace logger {

  struct LoggerConfig;

  class LoggerManagerTree;

  using LoggerManagerTreePtr = std::shared_ptr<LoggerManagerTree>;

}  // namespace logger

#endif  // CONSIGN_LOGGER_LOGGER_MANAGER_FWD_HPP
