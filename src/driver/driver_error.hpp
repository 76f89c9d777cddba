/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

#include <qtils/enum_error_code.hpp>

namespace rollup::driver {

  enum class DriverError : uint8_t {
    L1_RETRIEVAL_FAILED = 1,
    L1_RANGE_NOT_CONTIGUOUS,
    REORG_BASE_NOT_FOUND,
    REORG_BELOW_GENESIS,
    UNSAFE_HEAD_NOT_FOUND,
    SAFE_HEAD_NOT_FOUND,
    DERIVATION_STEP_FAILED,
    STARTUP_FAILED,
  };

}

OUTCOME_HPP_DECLARE_ERROR(rollup::driver, DriverError);
