/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/transfer_batch.hpp"

#include <thread>

#include <gtest/gtest.h>

#include "clock/impl/utc_clock_impl.hpp"
#include "common/io_thread.hpp"
#include "testutil/transport/fake_transport.hpp"

namespace ferry::node {
  using notification::BusConfig;
  using notification::NotificationBus;
  using notification::NotificationEvent;
  using orchestrator::OrchestratorConfig;
  using registry::SessionRegistry;
  using selector::ProtocolSelector;
  using transport::FakeTransport;
  using transport::TransportName;
  using namespace std::chrono_literals;

  class TransferBatchTest : public ::testing::Test {
   public:
    void TearDown() override {
      if (orchestrator) {
        orchestrator->shutdown(1000ms);
      }
      bus->stop();
    }

    void makeOrchestrator(FallbackOrchestrator::Transports transports) {
      orchestrator = std::make_shared<FallbackOrchestrator>(
          OrchestratorConfig{},
          *io_thread.io,
          std::move(transports),
          ProtocolSelector{},
          std::make_shared<SessionRegistry>(),
          bus,
          utc_clock);
    }

    static std::vector<ContentId> contentIds(size_t count) {
      std::vector<ContentId> ids;
      for (size_t i{0}; i < count; ++i) {
        ids.emplace_back(Bytes{0xc0, static_cast<uint8_t>(i)});
      }
      return ids;
    }

    IoThread io_thread;
    std::shared_ptr<clock::UTCClock> utc_clock{
        std::make_shared<clock::UTCClockImpl>()};
    std::shared_ptr<NotificationBus> bus{
        std::make_shared<NotificationBus>(BusConfig{2}, utc_clock)};
    std::shared_ptr<FallbackOrchestrator> orchestrator;
  };

  /**
   * @given bus subscriber slow enough to lose events
   * @when six transfers succeed
   * @then batch settles with every transfer counted as succeeded
   */
  TEST_F(TransferBatchTest, CountsDespiteDroppedEvents) {
    bus->subscribe({}, [](const NotificationEvent &) {
      std::this_thread::sleep_for(20ms);
    });
    makeOrchestrator(
        {{TransportName::kPeerStream,
          FakeTransport::delivering(TransportName::kPeerStream, {1})}});

    TransferBatch batch{orchestrator};
    auto sessions{batch.request(contentIds(6))};
    EXPECT_EQ(sessions.size(), 6);
    ASSERT_TRUE(batch.waitFor(5000ms));
    EXPECT_EQ(batch.succeeded(), 6);
    EXPECT_EQ(batch.failed(), 0);
  }

  /**
   * @given only failing transport
   * @when transfers are requested
   * @then each exhausted session is counted failed once
   */
  TEST_F(TransferBatchTest, CountsFailures) {
    makeOrchestrator(
        {{TransportName::kPeerStream,
          FakeTransport::failing(TransportName::kPeerStream,
                                 transport::Errored{"reset"})}});

    TransferBatch batch{orchestrator};
    batch.request(contentIds(3));
    ASSERT_TRUE(batch.waitFor(5000ms));
    EXPECT_EQ(batch.succeeded(), 0);
    EXPECT_EQ(batch.failed(), 3);
  }

  /**
   * @given orchestrator that no longer admits requests
   * @when transfers are requested
   * @then rejected requests are failed right away
   */
  TEST_F(TransferBatchTest, RejectedRequestsFail) {
    makeOrchestrator({});
    EXPECT_TRUE(orchestrator->shutdown(1000ms));

    TransferBatch batch{orchestrator};
    EXPECT_TRUE(batch.request(contentIds(2)).empty());
    EXPECT_TRUE(batch.waitFor(0ms));
    EXPECT_EQ(batch.failed(), 2);
  }

}  // namespace ferry::node
