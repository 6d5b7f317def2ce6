/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger.hpp"

namespace logger {

  const LogLevel kDefaultLogLevel = LogLevel::kInfo;

  void Logger::logFormatted(LogLevel level,
                            fmt::string_view format,
                            fmt::format_args args) const {
    std::string message;
    try {
      message = fmt::vformat(format, args);
    } catch (const fmt::format_error &error) {
      logInternal(LogLevel::kError,
                  std::string("Exception was thrown while logging: ")
                      + error.what());
      return;
    }
    logInternal(level, message);
  }

}  // namespace logger
