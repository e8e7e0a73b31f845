/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_NOTIFICATION_NOTIFICATION_BUS_HPP
#define CPP_FERRY_CORE_NOTIFICATION_NOTIFICATION_BUS_HPP

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <shared_mutex>
#include <vector>

#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "common/outcome.hpp"
#include "notification/notification_event.hpp"

namespace ferry::notification {

  using SubscriptionId = uint64_t;
  using EventHandler = std::function<void(const NotificationEvent &)>;
  using EventPredicate = std::function<bool(const NotificationEvent &)>;

  /**
   * Which events a subscriber wants. Empty criteria match everything.
   */
  struct SubscriptionFilter {
    std::set<EventKind> kinds;
    boost::optional<SessionId> session_id;
    /** Optional extra predicate, checked after kinds and session */
    EventPredicate predicate;

    bool matches(const NotificationEvent &event) const;
  };

  struct BusConfig {
    /** Per subscriber queue bound */
    size_t queue_capacity{256};
  };

  /**
   * In-process publish/subscribe hub.
   *
   * Every subscription has its own bounded queue and consumer thread, so the
   * publisher and other subscribers never wait for a slow handler. On
   * overflow the oldest queued event is dropped and the subscriber later
   * receives a single EVENTS_DROPPED marker with the number of lost events.
   * No history is kept.
   */
  class NotificationBus {
   public:
    NotificationBus(BusConfig config, std::shared_ptr<clock::UTCClock> clock);
    NotificationBus(const NotificationBus &) = delete;
    NotificationBus &operator=(const NotificationBus &) = delete;
    ~NotificationBus();

    /**
     * Registers a subscriber
     * @param filter - events of interest
     * @param handler - called on the subscription's own thread, exceptions
     * are logged and swallowed
     * @return handle for unsubscribe
     */
    SubscriptionId subscribe(SubscriptionFilter filter, EventHandler handler);

    /**
     * Removes subscriber, queued undelivered events are discarded.
     * Unknown handle is ignored.
     */
    void unsubscribe(SubscriptionId id);

    /// Enqueues event for every matching subscriber, never blocks on them
    void publish(NotificationEvent event);

    /// Total number of events dropped for the subscriber
    outcome::result<uint64_t> droppedCount(SubscriptionId id) const;

    size_t subscriberCount() const;

    /**
     * Delivers what is already queued, then closes all subscriptions. Further
     * publishes are ignored.
     */
    void stop();

   private:
    class Subscriber;

    BusConfig config_;
    std::shared_ptr<clock::UTCClock> clock_;

    mutable std::shared_mutex mutex_;
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> subscribers_;
    /** Closed from their own thread, joined on stop */
    std::vector<std::shared_ptr<Subscriber>> retired_;
    SubscriptionId next_id_{1};
    bool stopped_{false};

    common::Logger logger_;
  };

  enum class NotificationBusError {
    kUnknownSubscription = 1,
  };

}  // namespace ferry::notification

OUTCOME_HPP_DECLARE_ERROR(ferry::notification, NotificationBusError);

#endif  // CPP_FERRY_CORE_NOTIFICATION_NOTIFICATION_BUS_HPP
