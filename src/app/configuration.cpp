/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "app/configuration.hpp"

namespace rollup::app {

  Configuration::Configuration()
      : version_("undefined"),
        name_("unnamed"),
        mode_(driver::DriverMode::Follower),
        rollup_config_{} {}

  const std::string &Configuration::nodeVersion() const {
    return version_;
  }

  const std::string &Configuration::nodeName() const {
    return name_;
  }

  const std::filesystem::path &Configuration::rollupConfigPath() const {
    return rollup_config_path_;
  }

  driver::DriverMode Configuration::mode() const {
    return mode_;
  }

  const RollupConfig &Configuration::rollupConfig() const {
    return rollup_config_;
  }

}  // namespace rollup::app
