/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configurator.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "app/build_version.hpp"
#include "app/configuration.hpp"
#include "app/read_rollup_config_yaml.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollup::app, Configurator::Error, e) {
  using E = rollup::app::Configurator::Error;
  switch (e) {
    case E::CliArgsParseFailed:
      return "CLI Arguments parse failed";
    case E::ConfigFileParseFailed:
      return "Config file parse failed";
    case E::InvalidValue:
      return "Result config has invalid values";
  }
  return "Unknown app::Configurator::Error";
}

namespace {
  namespace po = boost::program_options;

  template <typename T, typename Func>
  void find_argument(const po::variables_map &vm, const char *name, Func &&f) {
    if (auto it = vm.find(name); it != vm.end() and not it->second.defaulted()) {
      std::forward<Func>(f)(it->second.as<T>());
    }
  }

  bool has_flag(const po::variables_map &vm, const char *name) {
    auto it = vm.find(name);
    return it != vm.end() and not it->second.defaulted();
  }

  constexpr std::string_view default_logging_yaml = R"yaml(
sinks:
  - name: console
    type: console
    stream: stdout
    thread: name
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: rollup
        children:
          - name: driver
          - name: sync
          - name: application
          - name: threads
)yaml";

}  // namespace

namespace rollup::app {

  Configurator::Configurator(int argc, const char **argv)
      : argc_(argc), argv_(argv), config_(std::make_shared<Configuration>()) {
    config_->version_ = buildVersion();
    config_->name_ = "noname";
    config_->mode_ = driver::DriverMode::Follower;

    // clang-format off

    po::options_description general_options("General options", 120, 100);
    general_options.add_options()
        ("help,h", "Show this help message.")
        ("version,v", "Show version information.")
        ("config,c", po::value<std::string>(), "Optional. Filepath to load configuration from. Overrides default configuration values.")
        ("name,n", po::value<std::string>(), "Set name of node.")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter.\n"
          "Syntax: <group>=<level>, e.g., -ldriver=debug.\n"
          "Log levels: trace, debug, verbose, info, warn, error, critical, off.\n"
          "Default: all groups log at `info`.\n"
          "Global log level can be set with: -l<level>.")
        ;

    po::options_description rollup_options("Rollup options");
    rollup_options.add_options()
        ("rollup-config", po::value<std::string>(), "Set path to rollup.yaml with block time, sequencing window size and genesis.")
        ("sequencer", "Produce layer-2 blocks as sequencer. Nodes follow layer-1 by default.")
        ;

    // clang-format on

    cli_options_.add(general_options).add(rollup_options);
  }

  outcome::result<bool> Configurator::step1() {
    po::options_description options;
    options.add_options()("help,h", "show help")("version,v", "show version")(
        "config,c", po::value<std::string>(), "config-file path");

    // first pass looks for "help", "version" and "config" only
    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc_, argv_)
                    .options(options)
                    .allow_unregistered()
                    .run(),
                vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    if (vm.contains("help")) {
      std::cout << "Rollup-node version " << buildVersion() << '\n'
                << cli_options_ << '\n';
      return true;
    }
    if (vm.contains("version")) {
      std::cout << "Rollup-node version " << buildVersion() << '\n';
      return true;
    }

    if (vm.contains("config")) {
      config_file_path_ = vm["config"].as<std::string>();
      try {
        config_file_ = YAML::LoadFile(*config_file_path_);
      } catch (const std::exception &exception) {
        std::cerr << "Error: Can't parse file "
                  << std::filesystem::weakly_canonical(*config_file_path_)
                  << ": " << exception.what() << "\n"
                  << "Option --config must be path to correct yaml-file\n";
        return Error::ConfigFileParseFailed;
      }
    }

    return false;
  }

  outcome::result<bool> Configurator::step2() {
    // second pass reports any unrecognized input
    try {
      po::store(
          po::command_line_parser(argc_, argv_).options(cli_options_).run(),
          cli_values_map_);
      po::notify(cli_values_map_);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information\n";
      return Error::CliArgsParseFailed;
    }

    find_argument<std::vector<std::string>>(
        cli_values_map_, "log", [&](const std::vector<std::string> &values) {
          logger_cli_args_ = values;
        });
    return false;
  }

  outcome::result<YAML::Node> Configurator::getLoggingConfig() const {
    if (config_file_.has_value()) {
      auto logging = (*config_file_)["logging"];
      if (logging.IsDefined()) {
        return logging;
      }
    }
    try {
      return YAML::Load(std::string(default_logging_yaml));
    } catch (const YAML::Exception &e) {
      std::cerr << "Failed to load default logging config: " << e.what()
                << '\n';
      return Error::ConfigFileParseFailed;
    }
  }

  outcome::result<std::shared_ptr<Configuration>> Configurator::calculateConfig(
      log::Logger logger) {
    logger_ = std::move(logger);
    OUTCOME_TRY(initGeneralConfig());
    OUTCOME_TRY(initRollupConfig());
    return config_;
  }

  void Configurator::fileError(std::string_view message) {
    file_errors_ << message << '\n';
    file_has_error_ = true;
  }

  outcome::result<void> Configurator::reportFileErrors() const {
    if (not file_has_error_) {
      return outcome::success();
    }
    SL_ERROR(logger_,
             "Config file `{}` has some problems:",
             config_file_path_.value_or(""));
    std::istringstream iss(file_errors_.str());
    std::string line;
    while (std::getline(iss, line)) {
      SL_ERROR(logger_, "  {}", line);
    }
    return Error::ConfigFileParseFailed;
  }

  void Configurator::readGeneralSection(const YAML::Node &section) {
    if (not section.IsMap()) {
      fileError("Section 'general' defined, but is not map");
      return;
    }

    auto read_scalar = [&](const char *key) -> std::optional<std::string> {
      auto node = section[key];
      if (not node.IsDefined()) {
        return std::nullopt;
      }
      if (not node.IsScalar()) {
        fileError(fmt::format("Value 'general.{}' must be scalar", key));
        return std::nullopt;
      }
      return node.as<std::string>();
    };

    if (auto name = read_scalar("name")) {
      config_->name_ = *name;
    }
    if (auto path = read_scalar("rollup-config")) {
      config_->rollup_config_path_ = *path;
    }
    if (auto sequencer = read_scalar("sequencer")) {
      if (*sequencer == "true") {
        config_->mode_ = driver::DriverMode::Sequencer;
      } else if (*sequencer == "false") {
        config_->mode_ = driver::DriverMode::Follower;
      } else {
        fileError(
            "Value 'general.sequencer' has wrong value. "
            "Expected 'true' or 'false'");
      }
    }
  }

  outcome::result<void> Configurator::initGeneralConfig() {
    if (config_file_.has_value()) {
      auto section = (*config_file_)["general"];
      if (section.IsDefined()) {
        readGeneralSection(section);
      }
    }
    OUTCOME_TRY(reportFileErrors());

    // command line overrides the file
    find_argument<std::string>(
        cli_values_map_, "name", [&](const std::string &value) {
          config_->name_ = value;
        });
    find_argument<std::string>(
        cli_values_map_, "rollup-config", [&](const std::string &value) {
          config_->rollup_config_path_ = value;
        });
    if (has_flag(cli_values_map_, "sequencer")) {
      config_->mode_ = driver::DriverMode::Sequencer;
    }

    if (config_->rollup_config_path_.empty()) {
      SL_ERROR(logger_, "The 'rollup-config' path must be provided");
      return Error::InvalidValue;
    }
    config_->rollup_config_path_ =
        std::filesystem::weakly_canonical(config_->rollup_config_path_);
    if (not is_regular_file(config_->rollup_config_path_)) {
      SL_ERROR(logger_,
               "The 'rollup-config' file does not exist or is not a file: {}",
               config_->rollup_config_path_.c_str());
      return Error::InvalidValue;
    }
    return outcome::success();
  }

  outcome::result<void> Configurator::initRollupConfig() {
    auto res = readRollupConfigYaml(config_->rollup_config_path_);
    if (res.has_error()) {
      SL_ERROR(logger_,
               "Can't read rollup config `{}`: {}",
               config_->rollup_config_path_.c_str(),
               res.error());
      return Error::InvalidValue;
    }
    config_->rollup_config_ = res.value();
    SL_INFO(logger_,
            "Rollup config: block time {}s, sequencing window {}, "
            "L1 genesis {}, L2 genesis {}",
            config_->rollup_config_.block_time,
            config_->rollup_config_.seq_window_size,
            config_->rollup_config_.genesis.l1,
            config_->rollup_config_.genesis.l2);
    return outcome::success();
  }

}  // namespace rollup::app
