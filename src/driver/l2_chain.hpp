/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <optional>

#include <qtils/outcome.hpp>

#include "types/block_id.hpp"

namespace rollup::driver {

  /**
   * Read access to the local layer-2 chain
   */
  class L2Chain {
   public:
    virtual ~L2Chain() = default;

    /**
     * @param number height of the block, or std::nullopt for the latest one
     * @return reference of the canonical layer-2 block
     */
    [[nodiscard]] virtual outcome::result<L2BlockRef> refByNumber(
        std::optional<BlockNumber> number) const = 0;
  };

}  // namespace rollup::driver
