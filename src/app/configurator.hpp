/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>
#include <sstream>

#include <boost/program_options.hpp>
#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>
#include <yaml-cpp/yaml.h>

#include "log/logger.hpp"

namespace rollup::app {
  class Configuration;
}  // namespace rollup::app

namespace rollup::app {

  /**
   * Builds node configuration from the command line and an optional yaml
   * config file. Command line values override file values.
   */
  class Configurator final {
   public:
    enum class Error : uint8_t {
      CliArgsParseFailed,
      ConfigFileParseFailed,
      InvalidValue,
    };

    Configurator(int argc, const char **argv);

    Configurator(const Configurator &) = delete;
    Configurator &operator=(const Configurator &) = delete;

    /**
     * Parses help, version and config file options
     * @return true if the node should exit right away
     */
    outcome::result<bool> step1();

    /**
     * Parses all options, rejecting unknown ones
     */
    outcome::result<bool> step2();

    /**
     * @return `logging` section of the config file, or default soralog
     * config
     */
    outcome::result<YAML::Node> getLoggingConfig() const;

    /// Filters given by `-l` options
    const std::vector<std::string> &getLoggingCliArgs() const {
      return logger_cli_args_;
    }

    outcome::result<std::shared_ptr<Configuration>> calculateConfig(
        log::Logger logger);

   private:
    outcome::result<void> initGeneralConfig();
    outcome::result<void> initRollupConfig();

    void readGeneralSection(const YAML::Node &section);
    void fileError(std::string_view message);
    outcome::result<void> reportFileErrors() const;

    int argc_;
    const char **argv_;

    std::shared_ptr<Configuration> config_;
    std::shared_ptr<soralog::Logger> logger_;

    std::optional<YAML::Node> config_file_;
    std::optional<std::string> config_file_path_;
    std::ostringstream file_errors_;
    bool file_has_error_ = false;
    std::vector<std::string> logger_cli_args_;

    boost::program_options::options_description cli_options_;
    boost::program_options::variables_map cli_values_map_;
  };

}  // namespace rollup::app

OUTCOME_HPP_DECLARE_ERROR(rollup::app, Configurator::Error);
