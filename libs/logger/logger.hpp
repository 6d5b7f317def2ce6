/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_LOGGER_LOGGER_HPP
#define CONSIGN_LOGGER_LOGGER_HPP

#include "logger/logger_fwd.hpp"

#include <string>
#include <type_traits>

#include <fmt/core.h>
#include <fmt/format.h>

namespace fmt {
  /// Objects with a toString() method, such as SigningError or a Signer, are
  /// formatted through it, honouring string format specs.
  template <typename T>
  struct formatter<
      T,
      std::enable_if_t<std::is_same<decltype(std::declval<const T &>()
                                                 .toString()),
                                    std::string>::value,
                       char>> : formatter<std::string> {
    template <typename FormatContext>
    auto format(const T &object, FormatContext &ctx) const
        -> decltype(ctx.out()) {
      return formatter<std::string>::format(object.toString(), ctx);
    }
  };
}  // namespace fmt

namespace logger {

  enum class LogLevel {
    kTrace,
    kDebug,
    kInfo,
    kWarn,
    kError,
    kCritical,
  };

  /// Level of loggers created without an explicit configuration
  extern const LogLevel kDefaultLogLevel;

  /**
   * Front end of every component log. Messages use fmt format strings and
   * are formatted only when the level is enabled. A message that fails to
   * format is replaced with an error line instead of throwing.
   */
  class Logger {
   public:
    virtual ~Logger() = default;

    template <typename... Args>
    void trace(const std::string &format, const Args &... args) const {
      log(LogLevel::kTrace, format, args...);
    }

    template <typename... Args>
    void debug(const std::string &format, const Args &... args) const {
      log(LogLevel::kDebug, format, args...);
    }

    template <typename... Args>
    void info(const std::string &format, const Args &... args) const {
      log(LogLevel::kInfo, format, args...);
    }

    template <typename... Args>
    void warn(const std::string &format, const Args &... args) const {
      log(LogLevel::kWarn, format, args...);
    }

    template <typename... Args>
    void error(const std::string &format, const Args &... args) const {
      log(LogLevel::kError, format, args...);
    }

    template <typename... Args>
    void critical(const std::string &format, const Args &... args) const {
      log(LogLevel::kCritical, format, args...);
    }

    template <typename... Args>
    void log(LogLevel level,
             const std::string &format,
             const Args &... args) const {
      if (shouldLog(level)) {
        logFormatted(level, format, fmt::make_format_args(args...));
      }
    }

   protected:
    virtual void logInternal(LogLevel level, const std::string &s) const = 0;

    /// Whether messages of the given level are emitted
    virtual bool shouldLog(LogLevel level) const = 0;

   private:
    void logFormatted(LogLevel level,
                      fmt::string_view format,
                      fmt::format_args args) const;
  };

}  // namespace logger

#endif  // CONSIGN_LOGGER_LOGGER_HPP
