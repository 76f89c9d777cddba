/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "types/block_id.hpp"

namespace rollup {

  struct Genesis {
    // layer-1 block the rollup starts deriving from
    BlockId l1;
    // first layer-2 block
    BlockId l2;
    TimestampSeconds l2_time = 0;

    /// Reference of the layer-2 genesis block anchored to the layer-1 one
    L2BlockRef l2Ref() const {
      return L2BlockRef{.self = l2, .time = l2_time, .l1_origin = l1};
    }

    bool operator==(const Genesis &) const = default;
  };

  /**
   * Immutable parameters of the rollup derivation
   */
  struct RollupConfig {
    // seconds between two layer-2 blocks
    uint64_t block_time = 0;
    // number of layer-1 blocks consumed by one derivation step
    uint64_t seq_window_size = 0;
    Genesis genesis;

    bool operator==(const RollupConfig &) const = default;
  };

}  // namespace rollup
