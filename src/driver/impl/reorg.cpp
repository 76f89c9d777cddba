/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "driver/reorg.hpp"

#include "driver/driver_error.hpp"
#include "driver/l1_chain.hpp"
#include "sync/l2_head_finder.hpp"

namespace rollup::driver {

  L1HeadUpdate classifyL1Head(const L1BlockRef &current,
                              const L1BlockRef &incoming) {
    if (current.self.hash == incoming.self.hash) {
      return L1HeadUpdate::Unchanged;
    }
    if (current.self.hash == incoming.parent.hash) {
      return L1HeadUpdate::LinearExtension;
    }
    return L1HeadUpdate::Reorg;
  }

  outcome::result<L1BlockRef> findL1ReorgBase(const L1Chain &l1,
                                              const L1BlockRef &new_head,
                                              const Genesis &genesis) {
    auto block = new_head;
    while (true) {
      if (block.self.number < genesis.l1.number) {
        return DriverError::REORG_BELOW_GENESIS;
      }
      auto canonical_res = l1.refByNumber(block.self.number);
      if (canonical_res.has_error()) {
        return DriverError::REORG_BASE_NOT_FOUND;
      }
      if (canonical_res.value().self.hash == block.self.hash) {
        return block;
      }
      auto parent_res = l1.refByHash(block.parent.hash);
      if (parent_res.has_error()) {
        return DriverError::REORG_BASE_NOT_FOUND;
      }
      block = parent_res.value();
    }
  }

  ReorgResolver::ReorgResolver(
      qtils::SharedRef<log::LoggingSystem> logsys,
      RollupConfig config,
      qtils::SharedRef<L1Chain> l1,
      qtils::SharedRef<sync::L2HeadFinder> head_finder)
      : logger_(logsys->getLogger("ReorgResolver", "driver")),
        config_(std::move(config)),
        l1_(std::move(l1)),
        head_finder_(std::move(head_finder)) {}

  outcome::result<ReorgResolution> ReorgResolver::resolve(
      const L1BlockRef &new_l1_head, const L2BlockRef &unsafe_head) const {
    auto base_res = findL1ReorgBase(*l1_, new_l1_head, config_.genesis);
    if (base_res.has_error()) {
      SL_DEBUG(logger_,
               "Could not fetch L1 reorg base when trying to handle a "
               "re-org: {}",
               base_res.error());
      return base_res.as_failure();
    }
    const auto &base = base_res.value();
    SL_DEBUG(logger_, "L1 reorg base is {}", base);

    auto unsafe_res =
        head_finder_->findUnsafeL2Head(unsafe_head, base.self, config_.genesis);
    if (unsafe_res.has_error()) {
      SL_DEBUG(logger_,
               "Could not get new unsafe L2 head when trying to handle a "
               "re-org: {}",
               unsafe_res.error());
      return DriverError::UNSAFE_HEAD_NOT_FOUND;
    }

    auto safe_res = head_finder_->findSafeL2Head(
        unsafe_head, base.self, config_.seq_window_size, config_.genesis);
    if (safe_res.has_error()) {
      SL_DEBUG(logger_,
               "Could not get new safe L2 head when trying to handle a "
               "re-org: {}",
               safe_res.error());
      return DriverError::SAFE_HEAD_NOT_FOUND;
    }

    return ReorgResolution{
        .l1_head = new_l1_head,
        .base = base,
        .unsafe_head = unsafe_res.value(),
        .safe_head = safe_res.value(),
    };
  }

}  // namespace rollup::driver
