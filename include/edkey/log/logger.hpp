/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef EDKEY_LOGGER_HPP
#define EDKEY_LOGGER_HPP

#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>

namespace edkey::log {

  using Level = soralog::Level;
  using Logger = std::shared_ptr<soralog::Logger>;

  inline const std::string defaultGroupName("edkey");

  /**
   * Install the logging system used by every logger of the library.
   * Must be executed once before the first createLogger() call.
   */
  void setLoggingSystem(std::shared_ptr<soralog::LoggingSystem> logging_system);

  [[nodiscard]] Logger createLogger(const std::string &tag);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group);

  [[nodiscard]] Logger createLogger(const std::string &tag,
                                    const std::string &group, Level level);

  void setLevelOfGroup(const std::string &group_name, Level level);
  void resetLevelOfGroup(const std::string &group_name);

  void setLevelOfLogger(const std::string &logger_name, Level level);
  void resetLevelOfLogger(const std::string &logger_name);

}  // namespace edkey::log

#endif  // EDKEY_LOGGER_HPP
