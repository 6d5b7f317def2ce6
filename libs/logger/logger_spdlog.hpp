/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_LOGGER_LOGGER_SPDLOG_HPP
#define CONSIGN_LOGGER_LOGGER_SPDLOG_HPP

#include "logger/logger.hpp"

#include <memory>
#include <string>

namespace spdlog {
  class logger;
}

namespace logger {

  /// Default output pattern: time, level, logger tag, message.
  extern const std::string kDefaultPattern;

  struct LoggerConfig {
    LogLevel log_level{kDefaultLogLevel};
    std::string pattern{kDefaultPattern};
  };

  using ConstLoggerConfigPtr = std::shared_ptr<const LoggerConfig>;

  /// Logger writing to the standard error stream through spdlog.
  class LoggerSpdlog : public Logger {
   public:
    /**
     * @param tag - the tagging name for identifying logger
     * @param config - logger configuration
     */
    LoggerSpdlog(const std::string &tag, ConstLoggerConfigPtr config);

   private:
    void logInternal(LogLevel level, const std::string &s) const override;

    bool shouldLog(LogLevel level) const override;

    const ConstLoggerConfigPtr config_;
    const std::shared_ptr<spdlog::logger> logger_;
  };

}  // namespace logger

#endif  // CONSIGN_LOGGER_LOGGER_SPDLOG_HPP
