/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "log/logger.hpp"
#include "types/rollup_config.hpp"

namespace rollup::sync {
  class L2HeadFinder;
}

namespace rollup::driver {
  class L1Chain;

  /// How a received layer-1 head relates to the recorded one
  enum class L1HeadUpdate : uint8_t {
    Unchanged,
    LinearExtension,
    Reorg,
  };

  enum class ReorgType : uint8_t {
    NoReorg,
    ShallowReorg,
    DeepReorg,
  };

  L1HeadUpdate classifyL1Head(const L1BlockRef &current,
                              const L1BlockRef &incoming);

  /**
   * Walks back from {@param new_head} by parent hash until a block which is
   * canonical at its height
   * @return last common ancestor of the old and the new layer-1 branches
   */
  outcome::result<L1BlockRef> findL1ReorgBase(const L1Chain &l1,
                                              const L1BlockRef &new_head,
                                              const Genesis &genesis);

  struct ReorgResolution {
    L1BlockRef l1_head;
    L1BlockRef base;
    L2BlockRef unsafe_head;
    L2BlockRef safe_head;
  };

  /**
   * Recomputes chain heads consistent with a new layer-1 branch. Has no
   * state of its own, the caller applies the result.
   */
  class ReorgResolver {
   public:
    ReorgResolver(qtils::SharedRef<log::LoggingSystem> logsys,
                  RollupConfig config,
                  qtils::SharedRef<L1Chain> l1,
                  qtils::SharedRef<sync::L2HeadFinder> head_finder);

    outcome::result<ReorgResolution> resolve(
        const L1BlockRef &new_l1_head, const L2BlockRef &unsafe_head) const;

   private:
    log::Logger logger_;
    RollupConfig config_;
    qtils::SharedRef<L1Chain> l1_;
    qtils::SharedRef<sync::L2HeadFinder> head_finder_;
  };

}  // namespace rollup::driver
