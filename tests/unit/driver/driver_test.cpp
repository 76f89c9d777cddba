/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>

#include <qtils/test/outcome.hpp>

#include "driver/driver.hpp"
#include "driver/driver_error.hpp"
#include "mock/driver/batch_submitter_mock.hpp"
#include "mock/driver/output_mock.hpp"
#include "mock/sync/l2_head_finder_mock.hpp"
#include "testutil/chains.hpp"
#include "testutil/prepare_loggers.hpp"
#include "utils/thread_pool.hpp"

using rollup::BatchData;
using rollup::BlockId;
using rollup::Genesis;
using rollup::L1BlockRef;
using rollup::L2BlockRef;
using rollup::RollupConfig;
using rollup::TestThreadPool;
using rollup::ThreadPool;
using rollup::TxHash;
using rollup::driver::BatchSubmitterMock;
using rollup::driver::Driver;
using rollup::driver::DriverError;
using rollup::driver::DriverMode;
using rollup::driver::L1ChainMock;
using rollup::driver::L2ChainMock;
using rollup::driver::NewBlock;
using rollup::driver::OutputPipelineMock;
using rollup::sync::L2HeadFinderMock;
using testing::_;
using testing::ElementsAre;
using testing::Invoke;
using testing::NiceMock;
using testing::Return;
using testutil::makeHash;
using testutil::makeId;
using testutil::makeL1;

class DriverTest : public testing::Test {
 public:
  class DriverHacked : public Driver {
   public:
    using Driver::Driver;
    using Driver::findNextL1Origin;
    using Driver::handleEpoch;
    using Driver::isBehindByWindow;
    using Driver::onBlockProductionRequest;
    using Driver::onL1Head;
    using Driver::requestBlockProduction;
    using Driver::requestStep;
    using Driver::state;
  };

  static constexpr uint8_t kL2Branch = 5;

  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    config = RollupConfig{
        .block_time = 2,
        .seq_window_size = 4,
        .genesis =
            Genesis{
                .l1 = makeId(100),
                .l2 = makeId(0, kL2Branch),
                .l2_time = 1000,
            },
    };
    l1_chain.install(*l1);
    l2_chain.install(*l2);
  }

  void TearDown() override {
    driver.reset();
  }

  std::shared_ptr<DriverHacked> makeDriver(DriverMode mode) {
    auto logsys = testutil::prepareLoggers();
    main_pool =
        std::make_shared<ThreadPool>(*logsys, TestThreadPool{main_io});
    submit_pool =
        std::make_shared<ThreadPool>(*logsys, TestThreadPool{submit_io});
    return std::make_shared<DriverHacked>(logsys,
                                          config,
                                          l1,
                                          l2,
                                          output,
                                          submitter,
                                          head_finder,
                                          mode,
                                          main_pool,
                                          submit_pool);
  }

  /// Starts the driver and runs the initial step request
  void startDriver(DriverMode mode) {
    driver = makeDriver(mode);
    ASSERT_OUTCOME_SUCCESS(driver->start());
    main_io->poll();
  }

  /// Makes {@param head} canonical on layer-1 and delivers it to the driver
  void feedL1Head(const L1BlockRef &head) {
    l1_chain.add(head);
    driver->onNewL1Head(head);
    main_io->poll();
  }

  /// Next safe block derived from the first block of the window
  static L2BlockRef derived(const L2BlockRef &safe_head,
                            const std::vector<BlockId> &window) {
    return L2BlockRef{
        .self = makeId(safe_head.self.number + 1, kL2Branch),
        .time = safe_head.time + 2,
        .l1_origin = window.front(),
    };
  }

  RollupConfig config;
  testutil::FakeL1 l1_chain;
  testutil::FakeL2 l2_chain;

  std::shared_ptr<NiceMock<L1ChainMock>> l1 =
      std::make_shared<NiceMock<L1ChainMock>>();
  std::shared_ptr<NiceMock<L2ChainMock>> l2 =
      std::make_shared<NiceMock<L2ChainMock>>();
  std::shared_ptr<OutputPipelineMock> output =
      std::make_shared<OutputPipelineMock>();
  std::shared_ptr<BatchSubmitterMock> submitter =
      std::make_shared<BatchSubmitterMock>();
  std::shared_ptr<L2HeadFinderMock> head_finder =
      std::make_shared<L2HeadFinderMock>();

  std::shared_ptr<boost::asio::io_context> main_io =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<boost::asio::io_context> submit_io =
      std::make_shared<boost::asio::io_context>();
  std::shared_ptr<ThreadPool> main_pool;
  std::shared_ptr<ThreadPool> submit_pool;

  std::shared_ptr<DriverHacked> driver;
};

/**
 * @given follower at layer-2 genesis and layer-1 head at layer-1 genesis
 * @when starting the driver
 * @then heads are taken from both chains and no step runs for lack of
 * layer-1 blocks
 */
TEST_F(DriverTest, StartFromGenesis) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  EXPECT_CALL(*output, step(_, _, _, _)).Times(0);

  startDriver(DriverMode::Follower);

  const auto &state = driver->state();
  EXPECT_EQ(state.l1_head, makeL1(100));
  EXPECT_EQ(state.l2_head, config.genesis.l2Ref());
  EXPECT_EQ(state.l2_safe_head, config.genesis.l2Ref());
  EXPECT_EQ(state.l2_finalized, config.genesis.l2);
  EXPECT_TRUE(state.l1_window.empty());
  EXPECT_EQ(driver->mode(), DriverMode::Follower);
}

/**
 * @given layer-2 head below the configured genesis
 * @when starting the driver
 * @then heads start from the genesis reference
 */
TEST_F(DriverTest, StartClampsToGenesis) {
  config.genesis.l2 = makeId(10, kL2Branch);
  l1_chain.addRange(95, 100);
  l2_chain.add(L2BlockRef{
      .self = makeId(3, kL2Branch), .time = 990, .l1_origin = makeId(97)});

  startDriver(DriverMode::Follower);

  EXPECT_EQ(driver->state().l2_head, config.genesis.l2Ref());
  EXPECT_EQ(driver->state().l2_safe_head, config.genesis.l2Ref());
}

/**
 * @given layer-1 which fails to return its head
 * @when starting the driver
 * @then STARTUP_FAILED is returned and no event is processed
 */
TEST_F(DriverTest, StartupFailure) {
  l2_chain.add(config.genesis.l2Ref());
  EXPECT_CALL(*l1, headRef())
      .WillOnce(Return(testutil::DummyError::ERROR))
      .WillOnce(Return(makeL1(100)));

  driver = makeDriver(DriverMode::Follower);
  EXPECT_OUTCOME_ERROR(res, driver->start(), DriverError::STARTUP_FAILED);

  // heads are not accepted before a successful start
  driver->onNewL1Head(makeL1(101));
  EXPECT_EQ(main_io->poll(), 0);

  // a failed start may be retried
  ASSERT_OUTCOME_SUCCESS(driver->start());
  EXPECT_EQ(driver->state().l1_head, makeL1(100));
}

/**
 * @given driver started once
 * @when starting it again
 * @then chains are not queried again and the loop is started once
 */
TEST_F(DriverTest, StartTwice) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  EXPECT_CALL(*l1, headRef()).WillOnce(Return(makeL1(100)));

  driver = makeDriver(DriverMode::Follower);
  ASSERT_OUTCOME_SUCCESS(driver->start());
  ASSERT_OUTCOME_SUCCESS(driver->start());

  // loop start handler and the step request it posts
  EXPECT_EQ(main_io->poll(), 2);
}

/**
 * @given rollup config with zero block time or zero sequencing window
 * @when constructing the driver
 * @then debug builds stop on the broken invariant
 */
TEST_F(DriverTest, ConfigChecked) {
  config.block_time = 0;
  EXPECT_DEBUG_DEATH(makeDriver(DriverMode::Sequencer), "");

  config.block_time = 2;
  config.seq_window_size = 0;
  EXPECT_DEBUG_DEATH(makeDriver(DriverMode::Follower), "");
}

/**
 * @given follower at genesis with layer-1 genesis 100
 * @when layer-1 heads 101..104 arrive linearly
 * @then the window follows the safe head origin and the step runs once the
 * head is a full window ahead, consuming one window entry
 */
TEST_F(DriverTest, StepRequestedWhenWindowAhead) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  startDriver(DriverMode::Follower);

  EXPECT_CALL(*output, step(_, _, _, _)).Times(0);
  for (rollup::BlockNumber n = 101; n <= 103; ++n) {
    feedL1Head(makeL1(n));
  }
  EXPECT_FALSE(driver->isBehindByWindow());
  EXPECT_THAT(driver->state().l1_window.entries(),
              ElementsAre(makeId(101), makeId(102), makeId(103)));
  testing::Mock::VerifyAndClearExpectations(output.get());

  L2BlockRef new_safe{
      .self = makeId(1, kL2Branch), .time = 1002, .l1_origin = makeId(101)};
  EXPECT_CALL(*output,
              step(config.genesis.l2Ref(),
                   config.genesis.l2,
                   config.genesis.l2,
                   ElementsAre(makeId(101), makeId(102), makeId(103),
                               makeId(104))))
      .WillOnce(Return(new_safe));
  feedL1Head(makeL1(104));

  const auto &state = driver->state();
  EXPECT_EQ(state.l1_head, makeL1(104));
  EXPECT_EQ(state.l2_safe_head, new_safe);
  EXPECT_EQ(state.l2_head, new_safe);
  EXPECT_THAT(state.l1_window.entries(),
              ElementsAre(makeId(102), makeId(103), makeId(104)));
}

/**
 * @given follower whose layer-1 head is several windows ahead
 * @when the loop starts
 * @then steps are repeated while a full window is buffered
 */
TEST_F(DriverTest, CatchUpSteps) {
  l1_chain.addRange(95, 110);
  l2_chain.add(config.genesis.l2Ref());
  EXPECT_CALL(*output, step(_, _, _, _))
      .Times(7)
      .WillRepeatedly(Invoke([](const L2BlockRef &safe_head,
                                const BlockId &,
                                const BlockId &,
                                const std::vector<BlockId> &window) {
        return outcome::result<L2BlockRef>(derived(safe_head, window));
      }));

  startDriver(DriverMode::Follower);

  const auto &state = driver->state();
  EXPECT_EQ(state.l2_safe_head.l1_origin, makeId(107));
  EXPECT_EQ(state.l2_safe_head.self.number, 7);
  EXPECT_THAT(state.l1_window.entries(),
              ElementsAre(makeId(108), makeId(109), makeId(110)));
}

/**
 * @given follower with a buffered window
 * @when the derivation step fails
 * @then heads and window stay unchanged and the step is not retried
 */
TEST_F(DriverTest, StepFailureKeepsState) {
  l1_chain.addRange(95, 104);
  l2_chain.add(config.genesis.l2Ref());
  // once by the loop, once by the check below
  EXPECT_CALL(*output, step(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Return(testutil::DummyError::ERROR));

  startDriver(DriverMode::Follower);

  const auto &state = driver->state();
  EXPECT_EQ(state.l2_safe_head, config.genesis.l2Ref());
  EXPECT_EQ(state.l1_window.size(), 4);
  EXPECT_OUTCOME_ERROR(
      res, driver->handleEpoch(), DriverError::DERIVATION_STEP_FAILED);
}

/**
 * @given follower with a buffered window
 * @when a layer-1 head arrives whose parent is not the recorded head
 * @then the reorg is resolved, the window is cleared and heads are the ones
 * found for the computed base
 */
TEST_F(DriverTest, ReorgResetsHeads) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  startDriver(DriverMode::Follower);
  feedL1Head(makeL1(101));
  ASSERT_EQ(driver->state().l1_window.size(), 1);

  // branch 1 replaces block 101
  l1_chain.add(makeL1(101, 1, 0, 101 * 12));
  auto new_head = makeL1(102, 1);
  L2BlockRef unsafe{
      .self = makeId(2, kL2Branch), .time = 1004, .l1_origin = makeId(100)};
  L2BlockRef safe = config.genesis.l2Ref();
  EXPECT_CALL(*head_finder,
              findUnsafeL2Head(config.genesis.l2Ref(),
                               new_head.self,
                               config.genesis))
      .WillOnce(Return(unsafe));
  EXPECT_CALL(*head_finder,
              findSafeL2Head(config.genesis.l2Ref(),
                             new_head.self,
                             config.seq_window_size,
                             config.genesis))
      .WillOnce(Return(safe));

  feedL1Head(new_head);

  const auto &state = driver->state();
  EXPECT_EQ(state.l1_head, new_head);
  EXPECT_TRUE(state.l1_window.empty());
  EXPECT_EQ(state.l2_head, unsafe);
  EXPECT_EQ(state.l2_safe_head, safe);

  // the same head again changes nothing
  driver->onNewL1Head(new_head);
  main_io->poll();
  EXPECT_EQ(state.l1_head, new_head);
  EXPECT_EQ(state.l2_head, unsafe);
  EXPECT_EQ(state.l2_safe_head, safe);
}

/**
 * @given follower
 * @when a reorg can't be resolved
 * @then the new layer-1 head is rejected and the state is kept
 */
TEST_F(DriverTest, UnresolvedReorgKeepsState) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  startDriver(DriverMode::Follower);
  feedL1Head(makeL1(101));

  l1_chain.add(makeL1(101, 1, 0, 101 * 12));
  EXPECT_CALL(*head_finder, findUnsafeL2Head(_, _, _))
      .WillOnce(Return(testutil::DummyError::ERROR));
  feedL1Head(makeL1(102, 1));

  const auto &state = driver->state();
  EXPECT_EQ(state.l1_head, makeL1(101));
  EXPECT_EQ(state.l1_window.size(), 1);
  EXPECT_EQ(state.l2_head, config.genesis.l2Ref());
}

/**
 * @given sequencer whose head is close to the time of its origin
 * @when looking for the next origin
 * @then the block following the current origin is fetched
 */
TEST_F(DriverTest, NextOriginAdvances) {
  l1_chain.addRange(95, 99);
  l1_chain.add(makeL1(100, 0, 0, 99));
  l1_chain.add(makeL1(101, 0, 0, 110));
  l1_chain.add(makeL1(102, 0, 0, 120));
  l2_chain.add(L2BlockRef{
      .self = makeId(5, kL2Branch), .time = 100, .l1_origin = makeId(100)});
  startDriver(DriverMode::Sequencer);

  // 100 + 2 >= 99
  EXPECT_CALL(*l1, refByNumber(101));
  ASSERT_OUTCOME_SUCCESS(origin, driver->findNextL1Origin());
  EXPECT_EQ(origin, makeL1(101, 0, 0, 110));
}

/**
 * @given sequencer whose origin is still ahead of its head in time
 * @when looking for the next origin
 * @then the current origin is kept
 */
TEST_F(DriverTest, NextOriginKept) {
  l1_chain.addRange(95, 99);
  l1_chain.add(makeL1(100, 0, 0, 110));
  l1_chain.add(makeL1(101, 0, 0, 120));
  l2_chain.add(L2BlockRef{
      .self = makeId(5, kL2Branch), .time = 100, .l1_origin = makeId(100)});
  startDriver(DriverMode::Sequencer);

  EXPECT_CALL(*l1, refByNumber(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS(origin, driver->findNextL1Origin());
  EXPECT_EQ(origin, makeL1(100, 0, 0, 110));
}

/**
 * @given sequencer whose origin is the layer-1 head
 * @when looking for the next origin
 * @then the head is returned without querying layer-1
 */
TEST_F(DriverTest, NextOriginIsHead) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  startDriver(DriverMode::Sequencer);

  EXPECT_CALL(*l1, refByHash(_)).Times(0);
  ASSERT_OUTCOME_SUCCESS(origin, driver->findNextL1Origin());
  EXPECT_EQ(origin, makeL1(100));
}

/**
 * @given sequencer whose next origin is the layer-1 genesis
 * @when block production is requested
 * @then no block is built
 */
TEST_F(DriverTest, NoProductionUntilPastGenesis) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  EXPECT_CALL(*output, newBlock(_, _, _, _)).Times(0);
  EXPECT_CALL(*submitter, submit(_, _)).Times(0);

  startDriver(DriverMode::Sequencer);
  driver->requestBlockProduction();
  main_io->poll();
  submit_io->poll();

  EXPECT_EQ(driver->state().l2_head, config.genesis.l2Ref());
}

/**
 * @given sequencer able to build a block
 * @when block production is requested several times before the loop runs
 * @then one block is built and its batch is submitted
 */
TEST_F(DriverTest, BlockProductionCoalesced) {
  l1_chain.addRange(95, 102);
  L2BlockRef head{
      .self = makeId(3, kL2Branch), .time = 1000, .l1_origin = makeId(101)};
  l2_chain.add(head);
  startDriver(DriverMode::Sequencer);

  NewBlock new_block{
      .head =
          L2BlockRef{
              .self = makeId(4, kL2Branch),
              .time = 1210,
              .l1_origin = makeId(101),
          },
      .batch =
          BatchData{
              .epoch = 101,
              .timestamp = 1210,
              .transactions = {qtils::ByteVec{1, 2, 3}},
          },
  };
  EXPECT_CALL(*output,
              newBlock(config.genesis.l2, head, head.self, makeId(101)))
      .WillOnce(Return(new_block));
  TxHash tx = makeHash(7, 9);
  EXPECT_CALL(*submitter, submit(config, ElementsAre(new_block.batch)))
      .WillOnce(Return(tx));

  driver->requestBlockProduction();
  driver->requestBlockProduction();
  driver->requestBlockProduction();
  main_io->poll();
  EXPECT_EQ(driver->state().l2_head, new_block.head);

  EXPECT_EQ(submit_io->poll(), 1);
}

/**
 * @given sequencer whose head is far behind the time of its origin
 * @when a block is built
 * @then the next block is requested right away
 */
TEST_F(DriverTest, BlockProductionCatchesUp) {
  l1_chain.addRange(95, 102);
  L2BlockRef head{
      .self = makeId(3, kL2Branch), .time = 1000, .l1_origin = makeId(101)};
  l2_chain.add(head);
  startDriver(DriverMode::Sequencer);

  // origin 101 has time 1212, blocks are built until 1212 <= time + 2
  EXPECT_CALL(*output, newBlock(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Invoke([](const BlockId &,
                                const L2BlockRef &unsafe_head,
                                const BlockId &,
                                const BlockId &l1_origin) {
        return outcome::result<NewBlock>(NewBlock{
            .head =
                L2BlockRef{
                    .self = makeId(unsafe_head.self.number + 1, kL2Branch),
                    .time = unsafe_head.time + 105,
                    .l1_origin = l1_origin,
                },
            .batch = {},
        });
      }));
  EXPECT_CALL(*submitter, submit(_, _))
      .Times(2)
      .WillRepeatedly(Return(testutil::DummyError::ERROR));

  driver->requestBlockProduction();
  main_io->poll();
  EXPECT_EQ(driver->state().l2_head.time, 1210);
  EXPECT_EQ(submit_io->poll(), 2);
}

/**
 * @given follower and sequencer
 * @when requests of the other role arrive
 * @then they are ignored
 */
TEST_F(DriverTest, RequestsIgnoredByRole) {
  l1_chain.addRange(95, 110);
  l2_chain.add(config.genesis.l2Ref());
  EXPECT_CALL(*output, step(_, _, _, _)).Times(0);
  EXPECT_CALL(*output, newBlock(_, _, _, _)).Times(0);

  // sequencer derives nothing although a window is available
  startDriver(DriverMode::Sequencer);
  EXPECT_TRUE(driver->isBehindByWindow());
  driver->requestStep();
  main_io->poll();
  EXPECT_EQ(driver->state().l2_safe_head, config.genesis.l2Ref());

  driver.reset();
  main_pool.reset();
  submit_pool.reset();
  main_io->restart();
  submit_io->restart();

  // follower builds nothing; layer-1 is cut back to 100 so no step runs
  l1_chain.addRange(95, 100);
  startDriver(DriverMode::Follower);
  driver->onBlockProductionRequest();
  EXPECT_EQ(driver->state().l2_head, config.genesis.l2Ref());
}

/**
 * @given running driver
 * @when closing it twice
 * @then the loop stops once and later heads are dropped
 */
TEST_F(DriverTest, CloseIsIdempotent) {
  l1_chain.addRange(95, 100);
  l2_chain.add(config.genesis.l2Ref());
  startDriver(DriverMode::Follower);

  driver->onNewL1Head(makeL1(101));
  driver->close();
  driver->close();
  EXPECT_TRUE(main_io->stopped());
  EXPECT_TRUE(submit_io->stopped());

  driver->onNewL1Head(makeL1(102));
  EXPECT_EQ(main_io->poll(), 0);
  EXPECT_EQ(driver->state().l1_head, makeL1(100));
}

/**
 * @given sequencer with one second block time and layer-1 blocks every
 * 12 seconds
 * @when the loop runs for two and a half block times
 * @then the block timer fires twice and a block is built on each tick, and
 * no block is built after close
 */
TEST_F(DriverTest, BlockTimerDrivesProduction) {
  config.block_time = 1;
  l1_chain.addRange(95, 110);
  l2_chain.add(L2BlockRef{
      .self = makeId(3, kL2Branch), .time = 1200, .l1_origin = makeId(100)});
  EXPECT_CALL(*output, newBlock(_, _, _, _))
      .Times(2)
      .WillRepeatedly(Invoke([](const BlockId &,
                                const L2BlockRef &unsafe_head,
                                const BlockId &,
                                const BlockId &l1_origin) {
        // block takes the time of its origin, so no catch-up is requested
        return outcome::result<NewBlock>(NewBlock{
            .head =
                L2BlockRef{
                    .self = makeId(unsafe_head.self.number + 1, kL2Branch),
                    .time = l1_origin.number * 12,
                    .l1_origin = l1_origin,
                },
            .batch = {},
        });
      }));

  startDriver(DriverMode::Sequencer);
  main_io->run_for(std::chrono::milliseconds(2500));

  const auto &state = driver->state();
  EXPECT_EQ(state.l2_head.self.number, 5);
  EXPECT_EQ(state.l2_head.l1_origin, makeId(102));
  testing::Mock::VerifyAndClearExpectations(output.get());

  EXPECT_CALL(*output, newBlock(_, _, _, _)).Times(0);
  driver->close();
  main_io->restart();
  main_io->run_for(std::chrono::milliseconds(1500));
  EXPECT_EQ(state.l2_head.self.number, 5);
}
