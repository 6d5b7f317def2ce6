/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_TEST_FRAMEWORK_MOCK_LOGGER_HPP
#define CONSIGN_TEST_FRAMEWORK_MOCK_LOGGER_HPP

#include "logger/logger.hpp"

#include <gmock/gmock.h>

namespace framework {

  /// Logger whose formatted output is checked with expectations
  class MockLogger : public logger::Logger {
   public:
    MOCK_CONST_METHOD2(logInternal, void(logger::LogLevel, const std::string &));
    MOCK_CONST_METHOD1(shouldLog, bool(logger::LogLevel));
  };

}  // namespace framework

#endif  // CONSIGN_TEST_FRAMEWORK_MOCK_LOGGER_HPP
