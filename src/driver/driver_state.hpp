/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "driver/l1_window.hpp"
#include "types/block_id.hpp"

namespace rollup::driver {

  /// Role of the node, fixed for the lifetime of the driver
  enum class DriverMode : uint8_t {
    Sequencer,
    Follower,
  };

  /**
   * Chain state of the driver. Owned and mutated by the event loop only.
   */
  struct DriverState {
    explicit DriverState(log::Logger logger) : l1_window(std::move(logger)) {}

    // latest recorded head of the layer-1 chain
    L1BlockRef l1_head;
    // unsafe head
    L2BlockRef l2_head;
    // head of the layer-2 chain as derived from layer-1, thus it is
    // sequencing window blocks behind
    L2BlockRef l2_safe_head;
    // layer-2 block that will never be reverted
    BlockId l2_finalized;
    // next layer-1 blocks to derive new layer-2 blocks from
    L1Window l1_window;
  };

}  // namespace rollup::driver
