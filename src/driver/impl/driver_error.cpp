/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "driver/driver_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(rollup::driver, DriverError, e) {
  using E = DriverError;
  switch (e) {
    case E::L1_RETRIEVAL_FAILED:
      return "Failed to retrieve a layer-1 block";
    case E::L1_RANGE_NOT_CONTIGUOUS:
      return "Layer-1 range does not continue the cached window";
    case E::REORG_BASE_NOT_FOUND:
      return "Common ancestor of the layer-1 reorg was not found";
    case E::REORG_BELOW_GENESIS:
      return "Layer-1 reorg reaches below the rollup genesis";
    case E::UNSAFE_HEAD_NOT_FOUND:
      return "New unsafe layer-2 head was not found after reorg";
    case E::SAFE_HEAD_NOT_FOUND:
      return "New safe layer-2 head was not found after reorg";
    case E::DERIVATION_STEP_FAILED:
      return "Derivation step failed";
    case E::STARTUP_FAILED:
      return "Initial chain heads are unavailable";
  }
  return "Unknown error";
}
