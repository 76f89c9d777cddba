/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>
#include <qtils/unhex.hpp>
#include <yaml-cpp/yaml.h>

#include "types/rollup_config.hpp"

namespace rollup::app {
  enum class RollupConfigError : uint8_t {
    INVALID = 1,
  };
  Q_ENUM_ERROR_CODE(RollupConfigError) {
    using E = decltype(e);
    switch (e) {
      case E::INVALID:
        return "Invalid rollup config";
    }
    abort();
  }

  namespace detail {
    inline outcome::result<BlockId> readBlockId(const YAML::Node &yaml) {
      if (not yaml.IsMap()) {
        return RollupConfigError::INVALID;
      }
      auto yaml_hash = yaml["hash"];
      auto yaml_number = yaml["number"];
      if (not yaml_hash.IsScalar() or not yaml_number.IsScalar()) {
        return RollupConfigError::INVALID;
      }
      BlockId id;
      if (not qtils::unhex0x(id.hash, yaml_hash.as<std::string>(), true)
                  .has_value()) {
        return RollupConfigError::INVALID;
      }
      id.number = yaml_number.as<BlockNumber>();
      return id;
    }

    inline outcome::result<RollupConfig> readRollupConfig(
        const YAML::Node &yaml) {
      if (not yaml.IsMap()) {
        return RollupConfigError::INVALID;
      }
      auto yaml_block_time = yaml["block_time"];
      auto yaml_window = yaml["seq_window_size"];
      auto yaml_genesis = yaml["genesis"];
      if (not yaml_block_time.IsScalar() or not yaml_window.IsScalar()
          or not yaml_genesis.IsMap()) {
        return RollupConfigError::INVALID;
      }
      auto yaml_l2_time = yaml_genesis["l2_time"];
      if (not yaml_l2_time.IsScalar()) {
        return RollupConfigError::INVALID;
      }

      RollupConfig config{
          .block_time = yaml_block_time.as<uint64_t>(),
          .seq_window_size = yaml_window.as<uint64_t>(),
      };
      if (config.block_time == 0 or config.seq_window_size == 0) {
        return RollupConfigError::INVALID;
      }
      BOOST_OUTCOME_TRY(config.genesis.l1, readBlockId(yaml_genesis["l1"]));
      BOOST_OUTCOME_TRY(config.genesis.l2, readBlockId(yaml_genesis["l2"]));
      config.genesis.l2_time = yaml_l2_time.as<TimestampSeconds>();
      return config;
    }
  }  // namespace detail

  /**
   * Parse rollup config from yaml text
   */
  inline outcome::result<RollupConfig> parseRollupConfigYaml(
      const std::string &text) {
    try {
      return detail::readRollupConfig(YAML::Load(text));
    } catch (const YAML::Exception &) {
      return RollupConfigError::INVALID;
    }
  }

  /**
   * Read block time, sequencing window size and genesis from rollup.yaml
   */
  inline outcome::result<RollupConfig> readRollupConfigYaml(
      const std::filesystem::path &path) {
    try {
      return detail::readRollupConfig(YAML::LoadFile(path.string()));
    } catch (const YAML::Exception &) {
      return RollupConfigError::INVALID;
    }
  }
}  // namespace rollup::app
