/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "sync/impl/l2_head_finder_impl.hpp"

#include "driver/l1_chain.hpp"
#include "driver/l2_chain.hpp"

namespace rollup::sync {

  L2HeadFinderImpl::L2HeadFinderImpl(
      qtils::SharedRef<log::LoggingSystem> logsys,
      qtils::SharedRef<driver::L1Chain> l1,
      qtils::SharedRef<driver::L2Chain> l2)
      : logger_(logsys->getLogger("L2HeadFinder", "sync")),
        l1_(std::move(l1)),
        l2_(std::move(l2)) {}

  outcome::result<L2BlockRef> L2HeadFinderImpl::findUnsafeL2Head(
      const L2BlockRef &head,
      const BlockId &l1_base,
      const Genesis &genesis) const {
    SL_TRACE(logger_,
             "Looking for unsafe head from {} down to l1 base {}",
             head,
             l1_base);
    auto block = head;
    while (true) {
      if (block.self.number <= genesis.l2.number) {
        OUTCOME_TRY(checkGenesis(block, genesis));
        return block;
      }
      BOOST_OUTCOME_TRY(auto canonical, isOriginCanonical(block, l1_base));
      if (canonical) {
        SL_DEBUG(logger_, "Unsafe head found: {}", block);
        return block;
      }
      BOOST_OUTCOME_TRY(block, parentOf(block));
    }
  }

  outcome::result<L2BlockRef> L2HeadFinderImpl::findSafeL2Head(
      const L2BlockRef &head,
      const BlockId &l1_base,
      uint64_t seq_window_size,
      const Genesis &genesis) const {
    BOOST_OUTCOME_TRY(auto block, findUnsafeL2Head(head, l1_base, genesis));
    while (true) {
      if (block.self.number <= genesis.l2.number) {
        OUTCOME_TRY(checkGenesis(block, genesis));
        return block;
      }
      if (block.l1_origin.number + seq_window_size <= l1_base.number) {
        SL_DEBUG(logger_, "Safe head found: {}", block);
        return block;
      }
      BOOST_OUTCOME_TRY(block, parentOf(block));
    }
  }

  outcome::result<bool> L2HeadFinderImpl::isOriginCanonical(
      const L2BlockRef &block, const BlockId &l1_base) const {
    const auto &origin = block.l1_origin;
    if (origin.number > l1_base.number) {
      return false;
    }
    if (origin.number == l1_base.number) {
      return origin.hash == l1_base.hash;
    }
    auto res = l1_->refByNumber(origin.number);
    if (res.has_error()) {
      SL_ERROR(logger_,
               "Can't get canonical layer-1 block at {}: {}",
               origin.number,
               res.error());
      return HeadFinderError::L1_RETRIEVAL_FAILED;
    }
    return res.value().self.hash == origin.hash;
  }

  outcome::result<L2BlockRef> L2HeadFinderImpl::parentOf(
      const L2BlockRef &block) const {
    auto res = l2_->refByNumber(block.self.number - 1);
    if (res.has_error()) {
      SL_ERROR(logger_,
               "Can't get parent of layer-2 block {}: {}",
               block,
               res.error());
      return HeadFinderError::L2_RETRIEVAL_FAILED;
    }
    return res.value();
  }

  outcome::result<void> L2HeadFinderImpl::checkGenesis(
      const L2BlockRef &block, const Genesis &genesis) const {
    if (block.self != genesis.l2) {
      SL_ERROR(logger_,
               "Reached layer-2 block {} which is not genesis {}",
               block,
               genesis.l2);
      return HeadFinderError::L2_GENESIS_MISMATCH;
    }
    return outcome::success();
  }

}  // namespace rollup::sync
