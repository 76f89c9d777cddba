/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>
#include <string>

#include "driver/driver_state.hpp"
#include "types/rollup_config.hpp"

namespace rollup::app {
  class Configuration {
   public:
    Configuration();
    virtual ~Configuration() = default;

    [[nodiscard]] virtual const std::string &nodeVersion() const;
    [[nodiscard]] virtual const std::string &nodeName() const;
    [[nodiscard]] virtual const std::filesystem::path &rollupConfigPath()
        const;
    [[nodiscard]] virtual driver::DriverMode mode() const;
    [[nodiscard]] virtual const RollupConfig &rollupConfig() const;

   private:
    friend class Configurator;  // for external configure

    std::string version_;
    std::string name_;
    std::filesystem::path rollup_config_path_;
    driver::DriverMode mode_;
    RollupConfig rollup_config_;
  };

}  // namespace rollup::app
