/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "framework/test_logger.hpp"

#include "logger/logger_manager.hpp"

logger::LoggerManagerTreePtr getTestLoggerManager(logger::LogLevel log_level) {
  return std::make_shared<logger::LoggerManagerTree>(
             logger::LoggerConfig{log_level, logger::kDefaultPattern})
      ->getChild("Test");
}

logger::LoggerPtr getTestLogger(const std::string &component,
                                logger::LogLevel log_level) {
  return getTestLoggerManager(log_level)->getChild(component)->getLogger();
}
