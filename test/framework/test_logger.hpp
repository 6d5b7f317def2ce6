/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_TEST_FRAMEWORK_TEST_LOGGER_HPP
#define CONSIGN_TEST_FRAMEWORK_TEST_LOGGER_HPP

#include <string>

#include "logger/logger.hpp"
#include "logger/logger_manager_fwd.hpp"

/// Logger tree rooted at "consign/Test", as handed to signContract
logger::LoggerManagerTreePtr getTestLoggerManager(
    logger::LogLevel log_level = logger::LogLevel::kDebug);

/// Logger of a single component under test
logger::LoggerPtr getTestLogger(
    const std::string &component,
    logger::LogLevel log_level = logger::LogLevel::kDebug);

#endif  // CONSIGN_TEST_FRAMEWORK_TEST_LOGGER_HPP
