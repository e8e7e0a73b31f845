/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "notification/notification_bus.hpp"

#include <future>

#include <gtest/gtest.h>

#include "clock/impl/utc_clock_impl.hpp"
#include "testutil/notification/event_collector.hpp"
#include "testutil/outcome.hpp"

namespace ferry::notification {

  class NotificationBusTest : public ::testing::Test {
   public:
    void makeBus(size_t capacity) {
      bus = std::make_shared<NotificationBus>(BusConfig{capacity}, utc_clock);
    }

    static NotificationEvent progress(SessionId id, uint64_t bytes) {
      NotificationEvent event;
      event.kind = EventKind::kTransferProgress;
      event.session_id = id;
      event.payload =
          TransferProgress{transport::TransportName::kPeerStream, bytes, 100};
      return event;
    }

    static NotificationEvent contentAdded() {
      NotificationEvent event;
      event.kind = EventKind::kContentAdded;
      event.payload = ContentChanged{content::ContentId{Bytes{1}}};
      return event;
    }

    static uint64_t bytes(const NotificationEvent &event) {
      return boost::get<TransferProgress>(event.payload).bytes;
    }

    std::shared_ptr<clock::UTCClock> utc_clock{
        std::make_shared<clock::UTCClockImpl>()};
    std::shared_ptr<NotificationBus> bus{
        std::make_shared<NotificationBus>(BusConfig{}, utc_clock)};
  };

  /**
   * @given two subscribers without filter
   * @when events are published
   * @then each subscriber receives all events in publish order
   */
  TEST_F(NotificationBusTest, FanOut) {
    EventCollector first{bus};
    EventCollector second{bus};
    EXPECT_EQ(bus->subscriberCount(), 2);

    for (uint64_t i{0}; i < 10; ++i) {
      bus->publish(progress(1, i));
    }
    ASSERT_TRUE(first.waitFor(10));
    ASSERT_TRUE(second.waitFor(10));
    for (auto *collector : {&first, &second}) {
      auto events{collector->events()};
      ASSERT_EQ(events.size(), 10);
      for (uint64_t i{0}; i < 10; ++i) {
        EXPECT_EQ(bytes(events[i]), i);
      }
    }
  }

  /**
   * @given subscribers filtering by kind, by session and by predicate
   * @when mixed events are published
   * @then each gets only matching events
   */
  TEST_F(NotificationBusTest, Filters) {
    SubscriptionFilter by_kind;
    by_kind.kinds = {EventKind::kContentAdded};
    SubscriptionFilter by_session;
    by_session.session_id = 2;
    SubscriptionFilter by_predicate;
    by_predicate.predicate = [](const NotificationEvent &event) {
      return event.kind == EventKind::kTransferProgress && bytes(event) > 50;
    };
    EventCollector kinds{bus, by_kind};
    EventCollector session{bus, by_session};
    EventCollector predicate{bus, by_predicate};

    bus->publish(progress(1, 10));
    bus->publish(progress(2, 20));
    bus->publish(contentAdded());
    bus->publish(progress(2, 60));
    bus->stop();

    EXPECT_EQ(kinds.kinds(), std::vector<EventKind>{EventKind::kContentAdded});
    auto session_events{session.events()};
    ASSERT_EQ(session_events.size(), 2);
    EXPECT_EQ(bytes(session_events[0]), 20);
    EXPECT_EQ(bytes(session_events[1]), 60);
    auto predicate_events{predicate.events()};
    ASSERT_EQ(predicate_events.size(), 1);
    EXPECT_EQ(bytes(predicate_events[0]), 60);
  }

  /**
   * @given subscriber blocked in its handler with queue of two
   * @when four more events are published
   * @then two oldest are dropped, marker with the count comes first, then
   * the newest events, publisher is never blocked
   */
  TEST_F(NotificationBusTest, OverflowDropsOldest) {
    makeBus(2);
    std::promise<void> entered;
    std::promise<void> release;
    auto released{release.get_future().share()};
    std::mutex mutex;
    std::vector<NotificationEvent> received;
    auto id{bus->subscribe({}, [&](const NotificationEvent &event) {
      {
        std::lock_guard lock{mutex};
        received.push_back(event);
        if (received.size() == 1) {
          entered.set_value();
        }
      }
      released.wait();
    })};

    bus->publish(progress(1, 1));
    entered.get_future().wait();
    for (uint64_t i{2}; i <= 5; ++i) {
      bus->publish(progress(1, i));
    }
    EXPECT_OUTCOME_EQ(bus->droppedCount(id), 2);

    release.set_value();
    bus->stop();

    ASSERT_EQ(received.size(), 4);
    EXPECT_EQ(bytes(received[0]), 1);
    EXPECT_EQ(received[1].kind, EventKind::kEventsDropped);
    EXPECT_EQ(boost::get<EventsDropped>(received[1].payload).count, 2);
    EXPECT_FALSE(received[1].session_id);
    EXPECT_EQ(bytes(received[2]), 4);
    EXPECT_EQ(bytes(received[3]), 5);
  }

  /**
   * @given subscriber whose handler throws
   * @when events are published
   * @then the failure does not stop its own delivery nor other subscribers
   */
  TEST_F(NotificationBusTest, HandlerExceptionIsIsolated) {
    std::atomic_size_t calls{0};
    bus->subscribe({}, [&](const NotificationEvent &) {
      ++calls;
      throw std::runtime_error{"broken subscriber"};
    });
    EventCollector healthy{bus};

    bus->publish(progress(1, 1));
    bus->publish(progress(1, 2));
    ASSERT_TRUE(healthy.waitFor(2));
    bus->stop();
    EXPECT_EQ(calls, 2);
  }

  /**
   * @given subscriber removed
   * @when events are published
   * @then it gets nothing, unknown handles are ignored or reported
   */
  TEST_F(NotificationBusTest, Unsubscribe) {
    std::atomic_size_t calls{0};
    auto id{bus->subscribe({}, [&](const NotificationEvent &) { ++calls; })};
    bus->unsubscribe(id);
    bus->unsubscribe(id);
    bus->unsubscribe(12345);
    EXPECT_EQ(bus->subscriberCount(), 0);

    bus->publish(contentAdded());
    bus->stop();
    EXPECT_EQ(calls, 0);
    EXPECT_OUTCOME_ERROR(NotificationBusError::kUnknownSubscription,
                         bus->droppedCount(id));
  }

  /**
   * @given subscriber that unsubscribes from inside its handler
   * @when an event is delivered
   * @then no deadlock, further events are not delivered
   */
  TEST_F(NotificationBusTest, UnsubscribeFromHandler) {
    std::atomic_size_t calls{0};
    std::promise<void> done;
    SubscriptionId id{};
    std::mutex mutex;
    {
      std::lock_guard lock{mutex};
      id = bus->subscribe({}, [&](const NotificationEvent &) {
        ++calls;
        SubscriptionId self;
        {
          std::lock_guard lock{mutex};
          self = id;
        }
        bus->unsubscribe(self);
        done.set_value();
      });
    }

    bus->publish(contentAdded());
    done.get_future().wait();
    bus->publish(contentAdded());
    bus->stop();
    EXPECT_EQ(calls, 1);
  }

  /**
   * @given slow subscriber with queued events
   * @when bus is stopped
   * @then queued events are delivered before stop returns and later
   * publishes are ignored
   */
  TEST_F(NotificationBusTest, StopDrainsQueue) {
    std::atomic_size_t calls{0};
    bus->subscribe({}, [&](const NotificationEvent &) {
      std::this_thread::sleep_for(std::chrono::milliseconds{5});
      ++calls;
    });
    for (uint64_t i{0}; i < 5; ++i) {
      bus->publish(progress(1, i));
    }
    bus->stop();
    EXPECT_EQ(calls, 5);

    bus->publish(progress(1, 6));
    EXPECT_EQ(calls, 5);
    EXPECT_EQ(bus->subscriberCount(), 0);
  }

}  // namespace ferry::notification
