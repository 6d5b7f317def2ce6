/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "logger/logger_spdlog.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

  spdlog::level::level_enum getSpdlogLogLevel(logger::LogLevel level) {
    switch (level) {
      case logger::LogLevel::kTrace:
        return spdlog::level::trace;
      case logger::LogLevel::kDebug:
        return spdlog::level::debug;
      case logger::LogLevel::kInfo:
        return spdlog::level::info;
      case logger::LogLevel::kWarn:
        return spdlog::level::warn;
      case logger::LogLevel::kError:
        return spdlog::level::err;
      case logger::LogLevel::kCritical:
        return spdlog::level::critical;
    }
    return spdlog::level::info;
  }

  /// All loggers share one colored stderr sink, so lines never interleave.
  std::shared_ptr<spdlog::sinks::sink> getSharedSink() {
    static std::once_flag init_flag;
    static std::shared_ptr<spdlog::sinks::sink> sink;
    std::call_once(init_flag, [] {
      sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    });
    return sink;
  }

  std::shared_ptr<spdlog::logger> makeSpdlogLogger(
      const std::string &tag, const logger::LoggerConfig &config) {
    auto spd_logger = std::make_shared<spdlog::logger>(tag, getSharedSink());
    spd_logger->set_level(getSpdlogLogLevel(config.log_level));
    spd_logger->set_pattern(config.pattern);
    return spd_logger;
  }

}  // namespace

namespace logger {

  const std::string kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e][%l] %n: %v";

  LoggerSpdlog::LoggerSpdlog(const std::string &tag,
                             ConstLoggerConfigPtr config)
      : config_(std::move(config)),
        logger_(makeSpdlogLogger(tag, *config_)) {}

  void LoggerSpdlog::logInternal(LogLevel level, const std::string &s) const {
    logger_->log(getSpdlogLogLevel(level), s);
  }

  bool LoggerSpdlog::shouldLog(LogLevel level) const {
    return static_cast<int>(config_->log_level) <= static_cast<int>(level);
  }

}  // namespace logger
