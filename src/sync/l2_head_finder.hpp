/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/enum_error_code.hpp>
#include <qtils/outcome.hpp>

#include "types/rollup_config.hpp"

namespace rollup::sync {

  enum class HeadFinderError : uint8_t {
    L2_GENESIS_MISMATCH = 1,
    L1_RETRIEVAL_FAILED,
    L2_RETRIEVAL_FAILED,
  };
  Q_ENUM_ERROR_CODE(HeadFinderError) {
    using E = decltype(e);
    switch (e) {
      case E::L2_GENESIS_MISMATCH:
        return "Layer-2 chain does not contain the configured genesis block";
      case E::L1_RETRIEVAL_FAILED:
        return "Failed to retrieve a layer-1 block";
      case E::L2_RETRIEVAL_FAILED:
        return "Failed to retrieve a layer-2 block";
    }
    return "Unknown HeadFinderError";
  }

  /**
   * Recomputes layer-2 heads after the layer-1 chain reorganized down to a
   * common ancestor
   */
  class L2HeadFinder {
   public:
    virtual ~L2HeadFinder() = default;

    /**
     * @param head unsafe head before the reorg
     * @param l1_base last layer-1 block common to both branches
     * @return latest layer-2 block whose l1 origin is canonical and not
     * above {@param l1_base}
     */
    [[nodiscard]] virtual outcome::result<L2BlockRef> findUnsafeL2Head(
        const L2BlockRef &head,
        const BlockId &l1_base,
        const Genesis &genesis) const = 0;

    /**
     * @param head unsafe head before the reorg
     * @param l1_base last layer-1 block common to both branches
     * @param seq_window_size sequencing window size
     * @return latest layer-2 block fully derived from layer-1 blocks which
     * precede {@param l1_base} by at least one sequencing window
     */
    [[nodiscard]] virtual outcome::result<L2BlockRef> findSafeL2Head(
        const L2BlockRef &head,
        const BlockId &l1_base,
        uint64_t seq_window_size,
        const Genesis &genesis) const = 0;
  };

}  // namespace rollup::sync
