/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <soralog/level.hpp>
#include <soralog/logger.hpp>
#include <soralog/logging_system.hpp>
#include <soralog/macro.hpp>
#include <yaml-cpp/yaml.h>

namespace rollup::log {
  using soralog::Level;

  using Logger = qtils::SharedRef<soralog::Logger>;

  enum class Error : uint8_t {
    WRONG_LEVEL = 1,
    WRONG_GROUP,
    WRONG_FILTER,
    WRONG_CONFIG,
  };

  outcome::result<Level> str2lvl(std::string_view str);

  inline static std::string defaultGroupName{"rollup"};

  /**
   * Creates soralog system with sinks and groups described by {@param config}
   * (soralog yaml format)
   */
  outcome::result<std::shared_ptr<soralog::LoggingSystem>> configureSoralog(
      const YAML::Node &config);

  /**
   * Logger factory of the node, shared by all components
   */
  class LoggingSystem {
   public:
    explicit LoggingSystem(
        std::shared_ptr<soralog::LoggingSystem> logging_system);

    LoggingSystem(const LoggingSystem &) = delete;
    LoggingSystem &operator=(const LoggingSystem &) = delete;

    /**
     * Applies command line filters: `<level>` for the whole node or
     * `<group>=<level>` for one group. Valid filters are applied even if
     * some others are rejected.
     * @return error of the first rejected filter
     */
    outcome::result<void> tuneLoggingSystem(
        const std::vector<std::string> &filters);

    [[nodiscard]]  //
    auto
    getLogger(const std::string &logger_name,
              const std::string &group_name) const {
      return logging_system_->getLogger(logger_name, group_name);
    }

    [[nodiscard]] bool setLevelOfGroup(const std::string &group_name,
                                       Level level) const {
      return logging_system_->setLevelOfGroup(group_name, level);
    }

    [[nodiscard]] bool resetLevelOfGroup(const std::string &group_name) const {
      return logging_system_->resetLevelOfGroup(group_name);
    }

    auto &getSoralog() const {
      return logging_system_;
    }

   private:
    outcome::result<void> applyFilter(std::string_view filter);

    std::shared_ptr<soralog::LoggingSystem> logging_system_;
  };

}  // namespace rollup::log

OUTCOME_HPP_DECLARE_ERROR(rollup::log, Error);
