/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/outcome.hpp>

#include "types/batch_data.hpp"
#include "types/block_id.hpp"

namespace rollup::driver {

  struct NewBlock {
    L2BlockRef head;
    BatchData batch;
  };

  /**
   * Derivation pipeline which executes layer-2 blocks
   */
  class OutputPipeline {
   public:
    virtual ~OutputPipeline() = default;

    /**
     * Derives the next safe layer-2 block from one sequencing window
     * @param safe_head current safe head
     * @param finalized current finalized block
     * @param unsafe_head current unsafe head
     * @param window exactly seq_window_size consecutive layer-1 blocks
     * @return new safe head
     */
    virtual outcome::result<L2BlockRef> step(
        const L2BlockRef &safe_head,
        const BlockId &finalized,
        const BlockId &unsafe_head,
        const std::vector<BlockId> &window) = 0;

    /**
     * Builds a new unsafe layer-2 block on top of {@param unsafe_head}
     * @return new unsafe head and the batch to be submitted to layer-1
     */
    virtual outcome::result<NewBlock> newBlock(const BlockId &finalized,
                                               const L2BlockRef &unsafe_head,
                                               const BlockId &safe_head,
                                               const BlockId &l1_origin) = 0;
  };

}  // namespace rollup::driver
