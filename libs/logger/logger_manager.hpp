/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CONSIGN_LOGGER_LOGGER_MANAGER_HPP
#define CONSIGN_LOGGER_LOGGER_MANAGER_HPP

#include "logger/logger_manager_fwd.hpp"

#include <map>
#include <mutex>
#include <string>

#include "logger/logger.hpp"
#include "logger/logger_spdlog.hpp"

namespace logger {

  /**
   * A node of the logger tree. Every node has a full tag made of the tags of
   * its ancestors and shares the configuration of the root.
   */
  class LoggerManagerTree {
   public:
    explicit LoggerManagerTree(ConstLoggerConfigPtr config);

    explicit LoggerManagerTree(LoggerConfig config);

    /// Get this node's logger. It is created on first request.
    LoggerPtr getLogger();

    /**
     * Get a child node. A missing child is created with this node's
     * configuration.
     * @param tag - the child's tag
     */
    LoggerManagerTreePtr getChild(const std::string &tag);

   private:
    LoggerManagerTree(std::string full_tag, ConstLoggerConfigPtr config);

    std::string makeChildFullTag(const std::string &child_tag) const;

    const std::string full_tag_;
    const ConstLoggerConfigPtr config_;
    LoggerPtr logger_;
    std::map<std::string, LoggerManagerTreePtr> children_;
    std::mutex mutex_;
  };

}  // namespace logger

#endif  // CONSIGN_LOGGER_LOGGER_MANAGER_HPP
