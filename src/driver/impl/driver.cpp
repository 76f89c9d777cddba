/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "driver/driver.hpp"

#include <chrono>

#include <boost/asio/post.hpp>
#include <boost/assert.hpp>

#include "driver/batch_submitter.hpp"
#include "driver/driver_error.hpp"
#include "driver/l1_chain.hpp"
#include "driver/l2_chain.hpp"
#include "driver/output.hpp"
#include "sync/l2_head_finder.hpp"
#include "utils/thread_pool.hpp"

namespace rollup::driver {

  Driver::Driver(qtils::SharedRef<log::LoggingSystem> logsys,
                 RollupConfig config,
                 qtils::SharedRef<L1Chain> l1,
                 qtils::SharedRef<L2Chain> l2,
                 qtils::SharedRef<OutputPipeline> output,
                 qtils::SharedRef<BatchSubmitter> submitter,
                 qtils::SharedRef<sync::L2HeadFinder> head_finder,
                 DriverMode mode,
                 qtils::SharedRef<ThreadPool> main_pool,
                 qtils::SharedRef<ThreadPool> submit_pool)
      : logger_(logsys->getLogger("Driver", "driver")),
        config_(std::move(config)),
        mode_(mode),
        l1_(l1),
        l2_(std::move(l2)),
        output_(std::move(output)),
        submitter_(std::move(submitter)),
        reorg_resolver_(logsys, config_, std::move(l1), std::move(head_finder)),
        main_pool_(std::move(main_pool)),
        submit_pool_(std::move(submit_pool)),
        block_timer_(*main_pool_->io_context()),
        state_(logsys->getLogger("L1Window", "driver")) {
    BOOST_ASSERT(config_.block_time > 0);
    BOOST_ASSERT(config_.seq_window_size > 0);
  }

  Driver::~Driver() {
    close();
  }

  template <typename F>
  void Driver::postToLoop(F &&f) {
    boost::asio::post(
        *main_pool_->io_context(),
        [weak{weak_from_this()}, f{std::forward<F>(f)}]() mutable {
          auto self = weak.lock();
          if (not self or self->stopped_.load()) {
            return;
          }
          f(*self);
        });
  }

  outcome::result<void> Driver::start() {
    if (started_.exchange(true)) {
      SL_WARN(logger_, "Driver is already started");
      return outcome::success();
    }

    auto l1_head_res = l1_->headRef();
    if (l1_head_res.has_error()) {
      SL_ERROR(logger_, "Can't get L1 head: {}", l1_head_res.error());
      started_ = false;
      return DriverError::STARTUP_FAILED;
    }
    auto l2_head_res = l2_->refByNumber(std::nullopt);
    if (l2_head_res.has_error()) {
      SL_ERROR(logger_, "Can't get L2 head: {}", l2_head_res.error());
      started_ = false;
      return DriverError::STARTUP_FAILED;
    }

    // TODO: pull the safe head from the sync-start algorithm once layer-2
    //  exposes it instead of starting from the unsafe head
    auto l2_head = l2_head_res.value();
    if (l2_head.self.number < config_.genesis.l2.number) {
      SL_INFO(logger_,
              "L2 head {} is below genesis {}, starting from genesis",
              l2_head,
              config_.genesis.l2);
      l2_head = config_.genesis.l2Ref();
    }

    state_.l1_head = l1_head_res.value();
    state_.l2_head = l2_head;
    state_.l2_safe_head = l2_head;
    state_.l2_finalized = config_.genesis.l2;

    postToLoop([](Driver &self) { self.onLoopStarted(); });
    return outcome::success();
  }

  void Driver::onNewL1Head(L1BlockRef head) {
    if (not started_.load() or stopped_.load()) {
      SL_TRACE(logger_, "Driver is not running; L1 head {} is dropped", head);
      return;
    }
    postToLoop([head](Driver &self) { self.onL1Head(head); });
  }

  void Driver::close() {
    if (stopped_.exchange(true)) {
      return;
    }
    SL_INFO(logger_, "Driver is closing");
    main_pool_->stop();
    // pending submissions are abandoned
    submit_pool_->stop();
  }

  void Driver::onLoopStarted() {
    SL_INFO(logger_,
            "State loop started as {}; l1Head={} l2Head={}",
            mode_ == DriverMode::Sequencer ? "sequencer" : "follower",
            state_.l1_head,
            state_.l2_head);
    switch (mode_) {
      case DriverMode::Sequencer:
        scheduleBlockTimer(true);
        break;
      case DriverMode::Follower:
        break;
    }
    requestStep();
  }

  void Driver::scheduleBlockTimer(bool first) {
    const auto period = std::chrono::seconds(config_.block_time);
    if (first) {
      block_timer_.expires_after(period);
    } else {
      block_timer_.expires_at(block_timer_.expiry() + period);
    }
    block_timer_.async_wait(
        [weak{weak_from_this()}](const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          auto self = weak.lock();
          if (not self or self->stopped_.load()) {
            return;
          }
          SL_TRACE(self->logger_, "L2 creation ticker");
          self->requestBlockProduction();
          self->scheduleBlockTimer(false);
        });
  }

  void Driver::requestStep() {
    if (step_requested_) {
      return;
    }
    step_requested_ = true;
    postToLoop([](Driver &self) { self.onStepRequest(); });
  }

  void Driver::requestBlockProduction() {
    if (block_production_requested_) {
      return;
    }
    block_production_requested_ = true;
    postToLoop([](Driver &self) { self.onBlockProductionRequest(); });
  }

  bool Driver::isBehindByWindow() const {
    return state_.l1_head.self.number
        >= state_.l2_head.l1_origin.number + config_.seq_window_size;
  }

  void Driver::onL1Head(const L1BlockRef &head) {
    SL_TRACE(logger_,
             "Received new L1 head; new_head={} old_head={}",
             head,
             state_.l1_head);

    switch (classifyL1Head(state_.l1_head, head)) {
      case L1HeadUpdate::Unchanged:
        SL_TRACE(logger_,
                 "Received L1 head signal that is the same as the current "
                 "head {}",
                 head);
        break;

      case L1HeadUpdate::LinearExtension:
        SL_TRACE(logger_, "Linear extension by {}", head);
        state_.l1_head = head;
        state_.l1_window.append(head, state_.l2_safe_head.l1_origin);
        break;

      case L1HeadUpdate::Reorg: {
        // Not strictly always a reorg, but that is the most likely case
        SL_WARN(logger_,
                "L1 head signal indicates an L1 re-org; old_l1_head={} "
                "new_l1_head_parent={} new_l1_head={}",
                state_.l1_head,
                head.parent,
                head);
        auto res = reorg_resolver_.resolve(head, state_.l2_head);
        if (res.has_error()) {
          SL_ERROR(logger_,
                   "L1 head {} is rejected: {}",
                   head,
                   res.error());
          return;
        }
        auto &resolution = res.value();
        state_.l1_head = resolution.l1_head;
        state_.l1_window.clear();
        // Note that follower nodes can get an unsafe head here as well
        state_.l2_head = resolution.unsafe_head;
        state_.l2_safe_head = resolution.safe_head;
        SL_INFO(logger_,
                "L1 re-org resolved at base {}; l2Head={} l2SafeHead={}",
                resolution.base,
                state_.l2_head,
                state_.l2_safe_head);
      } break;
    }

    if (isBehindByWindow()) {
      requestStep();
    }
  }

  void Driver::onStepRequest() {
    step_requested_ = false;

    switch (mode_) {
      case DriverMode::Sequencer:
        SL_TRACE(logger_, "Skipping extension based on L1 chain as sequencer");
        return;
      case DriverMode::Follower:
        break;
    }

    SL_TRACE(logger_, "Got step request");
    auto res = handleEpoch();
    if (res.has_error()) {
      SL_ERROR(logger_, "Error handling epoch: {}", res.error());
      return;
    }
    auto &epoch = res.value();
    const bool advanced = epoch.safe_head != state_.l2_safe_head;
    state_.l2_head = epoch.head;
    state_.l2_safe_head = epoch.safe_head;

    // Immediately run next step if we have enough blocks
    // TODO: a step that failed or did not advance is retried on the next
    //  L1 head only; add a backoff retry to re-post it while still behind
    if (advanced and isBehindByWindow()) {
      requestStep();
    }
  }

  outcome::result<EpochResult> Driver::handleEpoch() {
    SL_TRACE(logger_,
             "Handling epoch; l2Head={} l2SafeHead={} l1Base={}",
             state_.l2_head,
             state_.l2_safe_head,
             state_.l2_safe_head.l1_origin);

    const auto &origin = state_.l2_safe_head.l1_origin;

    // Extend cached window if we do not have enough saved blocks
    if (state_.l1_window.size() < config_.seq_window_size) {
      auto res = state_.l1_window.extend(*l1_, origin);
      if (res.has_error()) {
        return res.as_failure();
      }
    }

    auto window = state_.l1_window.windowFor(config_.seq_window_size);
    if (not window.has_value()) {
      SL_TRACE(logger_,
               "Not enough cached blocks to run step; cached_window_len={}",
               state_.l1_window.size());
      return EpochResult{
          .head = state_.l2_head,
          .safe_head = state_.l2_safe_head,
      };
    }

    // TODO: the unsafe head is folded into the safe head here; track the
    //  unsafe chain ahead of the safe head and report shallow reorgs
    auto step_res = output_->step(state_.l2_safe_head,
                                  state_.l2_finalized,
                                  state_.l2_head.self,
                                  window.value());
    if (step_res.has_error()) {
      SL_DEBUG(logger_, "Error in running the output step: {}",
               step_res.error());
      return DriverError::DERIVATION_STEP_FAILED;
    }
    state_.l1_window.evictFront();

    auto &new_head = step_res.value();
    SL_DEBUG(logger_, "New safe head {}", new_head);
    return EpochResult{
        .head = new_head,
        .safe_head = new_head,
        .reorg_type = ReorgType::NoReorg,
    };
  }

  outcome::result<L1BlockRef> Driver::findNextL1Origin() {
    const auto &current = state_.l2_head.l1_origin;
    if (current.hash == state_.l1_head.self.hash) {
      return state_.l1_head;
    }
    SL_DEBUG(logger_,
             "Find next l1Origin; l2Head={} l1Origin={}",
             state_.l2_head,
             current);

    auto current_res = l1_->refByHash(current.hash);
    if (current_res.has_error()) {
      SL_ERROR(logger_,
               "Can't get current L1 origin {}: {}",
               current,
               current_res.error());
      return DriverError::L1_RETRIEVAL_FAILED;
    }
    auto &current_ref = current_res.value();

    if (state_.l2_head.time + config_.block_time >= current_ref.time) {
      auto next_res = l1_->refByNumber(current.number + 1);
      if (next_res.has_error()) {
        SL_ERROR(logger_,
                 "Can't get L1 block {} after origin: {}",
                 current.number + 1,
                 next_res.error());
        return DriverError::L1_RETRIEVAL_FAILED;
      }
      SL_DEBUG(logger_, "Looking up new L1 origin {}", next_res.value());
      return next_res.value();
    }
    return current_ref;
  }

  void Driver::onBlockProductionRequest() {
    block_production_requested_ = false;

    switch (mode_) {
      case DriverMode::Sequencer:
        break;
      case DriverMode::Follower:
        SL_TRACE(logger_, "Skipping block production as follower");
        return;
    }

    auto origin_res = findNextL1Origin();
    if (origin_res.has_error()) {
      SL_ERROR(logger_, "Error finding next L1 origin: {}", origin_res.error());
      return;
    }
    const auto next_origin = origin_res.value();

    if (next_origin.time <= config_.block_time + state_.l2_head.time) {
      SL_TRACE(logger_, "Skipping block production; l2Head={}", state_.l2_head);
      return;
    }
    // Don't produce blocks until past the L1 genesis
    if (next_origin.self.number <= config_.genesis.l1.number) {
      SL_TRACE(logger_,
               "Skipping block production before L1 genesis; origin={}",
               next_origin);
      return;
    }

    auto block_res = output_->newBlock(state_.l2_finalized,
                                       state_.l2_head,
                                       state_.l2_safe_head.self,
                                       next_origin.self);
    if (block_res.has_error()) {
      SL_ERROR(logger_,
               "Could not extend chain as sequencer; l2UnsafeHead={} "
               "l1Origin={}: {}",
               state_.l2_head,
               next_origin,
               block_res.error());
      return;
    }
    auto &new_block = block_res.value();

    state_.l2_head = new_block.head;
    SL_TRACE(logger_, "Created new l2 block; l2UnsafeHead={}", state_.l2_head);

    submitBatch(std::move(new_block.batch));

    if (next_origin.time > state_.l2_head.time + config_.block_time) {
      SL_TRACE(logger_,
               "Asking for a second L2 block asap; l2Head={}",
               state_.l2_head);
      requestBlockProduction();
    }
  }

  void Driver::submitBatch(BatchData batch) {
    boost::asio::post(
        *submit_pool_->io_context(),
        [logger{logger_},
         submitter{submitter_},
         config{config_},
         batch{std::move(batch)}]() mutable {
          std::vector<BatchData> batches;
          batches.emplace_back(std::move(batch));
          auto res = submitter->submit(config, batches);
          if (res.has_error()) {
            SL_ERROR(logger, "Error submitting batch: {}", res.error());
            return;
          }
          SL_DEBUG(logger, "Batch submitted in tx {:0x}", res.value());
        });
  }

}  // namespace rollup::driver
