/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/logger.hpp"

#include <iostream>
#include <tuple>

#include <soralog/impl/configurator_from_yaml.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(rollup::log, Error, e) {
  using E = rollup::log::Error;
  switch (e) {
    case E::WRONG_LEVEL:
      return "Unknown level";
    case E::WRONG_GROUP:
      return "Unknown group";
    case E::WRONG_FILTER:
      return "Malformed logging filter; expected <level> or <group>=<level>";
    case E::WRONG_CONFIG:
      return "Logging config is invalid";
  }
  return "Unknown log::Error";
}

namespace rollup::log {

  outcome::result<Level> str2lvl(std::string_view str) {
    if (str == "trace") {
      return Level::TRACE;
    }
    if (str == "debug") {
      return Level::DEBUG;
    }
    if (str == "verbose") {
      return Level::VERBOSE;
    }
    if (str == "info" or str == "inf") {
      return Level::INFO;
    }
    if (str == "warning" or str == "warn") {
      return Level::WARN;
    }
    if (str == "error" or str == "err") {
      return Level::ERROR;
    }
    if (str == "critical" or str == "crit") {
      return Level::CRITICAL;
    }
    if (str == "off" or str == "no") {
      return Level::OFF;
    }
    return Error::WRONG_LEVEL;
  }

  outcome::result<std::shared_ptr<soralog::LoggingSystem>> configureSoralog(
      const YAML::Node &config) {
    if (not config.IsDefined()) {
      return Error::WRONG_CONFIG;
    }
    auto configurator = std::make_shared<soralog::ConfiguratorFromYAML>(config);
    auto logging_system =
        std::make_shared<soralog::LoggingSystem>(std::move(configurator));

    auto result = logging_system->configure();
    if (not result.message.empty()) {
      (result.has_error ? std::cerr : std::cout) << result.message << '\n';
    }
    if (result.has_error) {
      return Error::WRONG_CONFIG;
    }
    return logging_system;
  }

  LoggingSystem::LoggingSystem(
      std::shared_ptr<soralog::LoggingSystem> logging_system)
      : logging_system_(std::move(logging_system)) {}

  outcome::result<void> LoggingSystem::tuneLoggingSystem(
      const std::vector<std::string> &filters) {
    outcome::result<void> first_error = outcome::success();
    for (auto &filter : filters) {
      auto res = applyFilter(filter);
      if (res.has_error() and not first_error.has_error()) {
        first_error = res.as_failure();
      }
    }
    return first_error;
  }

  outcome::result<void> LoggingSystem::applyFilter(std::string_view filter) {
    auto eq = filter.find('=');
    if (eq == std::string_view::npos) {
      BOOST_OUTCOME_TRY(auto level, str2lvl(filter));
      std::ignore = logging_system_->setLevelOfGroup(defaultGroupName, level);
      return outcome::success();
    }

    std::string group_name{filter.substr(0, eq)};
    auto level_string = filter.substr(eq + 1);
    if (group_name.empty() or level_string.empty()) {
      return Error::WRONG_FILTER;
    }
    if (not logging_system_->getGroup(group_name)) {
      return Error::WRONG_GROUP;
    }
    BOOST_OUTCOME_TRY(auto level, str2lvl(level_string));
    std::ignore = logging_system_->setLevelOfGroup(group_name, level);
    return outcome::success();
  }

}  // namespace rollup::log
