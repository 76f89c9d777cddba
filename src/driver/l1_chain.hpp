/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include <qtils/outcome.hpp>

#include "types/block_id.hpp"

namespace rollup::driver {

  /**
   * Read access to the layer-1 chain
   */
  class L1Chain {
   public:
    virtual ~L1Chain() = default;

    /**
     * @return reference of the current layer-1 head
     */
    [[nodiscard]] virtual outcome::result<L1BlockRef> headRef() const = 0;

    /**
     * @return reference of the canonical block at height {@param number}
     */
    [[nodiscard]] virtual outcome::result<L1BlockRef> refByNumber(
        BlockNumber number) const = 0;

    /**
     * @return reference of the block with {@param hash}, canonical or not
     */
    [[nodiscard]] virtual outcome::result<L1BlockRef> refByHash(
        const BlockHash &hash) const = 0;

    /**
     * Canonical blocks following {@param base}
     * @return ids in ascending order without gaps, possibly empty
     */
    [[nodiscard]] virtual outcome::result<std::vector<BlockId>> rangeAfter(
        const BlockId &base) const = 0;
  };

}  // namespace rollup::driver
