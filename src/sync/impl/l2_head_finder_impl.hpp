/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "sync/l2_head_finder.hpp"

namespace rollup::driver {
  class L1Chain;
  class L2Chain;
}  // namespace rollup::driver

namespace rollup::sync {

  /**
   * Finds new heads by walking the local layer-2 chain backwards by number
   * and checking l1 origins against the canonical layer-1 chain
   */
  class L2HeadFinderImpl final : public L2HeadFinder {
   public:
    L2HeadFinderImpl(qtils::SharedRef<log::LoggingSystem> logsys,
                     qtils::SharedRef<driver::L1Chain> l1,
                     qtils::SharedRef<driver::L2Chain> l2);

    outcome::result<L2BlockRef> findUnsafeL2Head(
        const L2BlockRef &head,
        const BlockId &l1_base,
        const Genesis &genesis) const override;

    outcome::result<L2BlockRef> findSafeL2Head(
        const L2BlockRef &head,
        const BlockId &l1_base,
        uint64_t seq_window_size,
        const Genesis &genesis) const override;

   private:
    outcome::result<bool> isOriginCanonical(const L2BlockRef &block,
                                            const BlockId &l1_base) const;
    outcome::result<L2BlockRef> parentOf(const L2BlockRef &block) const;
    outcome::result<void> checkGenesis(const L2BlockRef &block,
                                       const Genesis &genesis) const;

    log::Logger logger_;
    qtils::SharedRef<driver::L1Chain> l1_;
    qtils::SharedRef<driver::L2Chain> l2_;
  };

}  // namespace rollup::sync
