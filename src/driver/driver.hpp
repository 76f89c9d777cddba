/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>
#include <memory>

#include <boost/asio/steady_timer.hpp>
#include <qtils/outcome.hpp>
#include <qtils/shared_ref.hpp>

#include "driver/driver_state.hpp"
#include "driver/reorg.hpp"
#include "log/logger.hpp"
#include "types/batch_data.hpp"
#include "types/rollup_config.hpp"

namespace rollup {
  class ThreadPool;
}
namespace rollup::sync {
  class L2HeadFinder;
}

namespace rollup::driver {
  class L1Chain;
  class L2Chain;
  class OutputPipeline;
  class BatchSubmitter;

  struct EpochResult {
    L2BlockRef head;
    L2BlockRef safe_head;
    // always NoReorg, reorgs are detected on layer-1 head updates
    ReorgType reorg_type = ReorgType::NoReorg;
  };

  /**
   * Rollup driver: keeps the layer-2 chain in line with layer-1.
   *
   * All chain state is mutated by one event loop running on `main_pool`.
   * It reacts on new layer-1 heads, on its own step and block production
   * requests, and (as sequencer) on the block production timer. Batches of
   * produced blocks are submitted on `submit_pool` without touching the
   * state.
   */
  class Driver  // left non-final on purpose to be accessible in tests
      : public std::enable_shared_from_this<Driver> {
   public:
    Driver(qtils::SharedRef<log::LoggingSystem> logsys,
           RollupConfig config,
           qtils::SharedRef<L1Chain> l1,
           qtils::SharedRef<L2Chain> l2,
           qtils::SharedRef<OutputPipeline> output,
           qtils::SharedRef<BatchSubmitter> submitter,
           qtils::SharedRef<sync::L2HeadFinder> head_finder,
           DriverMode mode,
           qtils::SharedRef<ThreadPool> main_pool,
           qtils::SharedRef<ThreadPool> submit_pool);

    Driver(const Driver &) = delete;
    Driver &operator=(const Driver &) = delete;
    virtual ~Driver();

    /**
     * Initializes chain heads from both chains and starts the event loop
     * @return error if initial heads can't be fetched; the loop is not
     * started in that case
     */
    outcome::result<void> start();

    /**
     * Delivers a new layer-1 head into the event loop. Thread-safe.
     * Heads received before start or after close are dropped.
     */
    void onNewL1Head(L1BlockRef head);

    /// Stops the event loop. Only the first call has effect.
    void close();

    DriverMode mode() const {
      return mode_;
    }

   protected:
    const DriverState &state() const {
      return state_;
    }

    void onL1Head(const L1BlockRef &head);
    void onStepRequest();
    void onBlockProductionRequest();

    /// Posts a step request unless one is already pending
    void requestStep();

    /// Posts a block production request unless one is already pending
    void requestBlockProduction();

    /**
     * Consumes one sequencing window to derive the next safe block
     */
    outcome::result<EpochResult> handleEpoch();

    /**
     * @return l1 origin to build the next unsafe block on
     */
    outcome::result<L1BlockRef> findNextL1Origin();

    /// True if layer-1 is at least one sequencing window ahead of the head
    bool isBehindByWindow() const;

   private:
    void onLoopStarted();
    void scheduleBlockTimer(bool first);
    void submitBatch(BatchData batch);

    template <typename F>
    void postToLoop(F &&f);

    log::Logger logger_;
    const RollupConfig config_;
    const DriverMode mode_;

    qtils::SharedRef<L1Chain> l1_;
    qtils::SharedRef<L2Chain> l2_;
    qtils::SharedRef<OutputPipeline> output_;
    qtils::SharedRef<BatchSubmitter> submitter_;
    ReorgResolver reorg_resolver_;

    qtils::SharedRef<ThreadPool> main_pool_;
    qtils::SharedRef<ThreadPool> submit_pool_;
    boost::asio::steady_timer block_timer_;

    DriverState state_;

    // pending requests; accessed from the loop only
    bool step_requested_ = false;
    bool block_production_requested_ = false;

    std::atomic_bool started_ = false;
    std::atomic_bool stopped_ = false;
  };

}  // namespace rollup::driver
