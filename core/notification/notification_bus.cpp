/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "notification/notification_bus.hpp"

#include <algorithm>
#include <deque>
#include <mutex>

#include <boost/asio/post.hpp>
#include "common/io_thread.hpp"

namespace ferry::notification {

  bool SubscriptionFilter::matches(const NotificationEvent &event) const {
    if (not kinds.empty() && kinds.count(event.kind) == 0) {
      return false;
    }
    if (session_id && event.session_id != session_id) {
      return false;
    }
    return not predicate || predicate(event);
  }

  class NotificationBus::Subscriber {
   public:
    Subscriber(SubscriptionId id,
               SubscriptionFilter filter,
               EventHandler handler,
               size_t capacity,
               std::shared_ptr<clock::UTCClock> clock,
               common::Logger logger)
        : id_{id},
          filter_{std::move(filter)},
          handler_{std::move(handler)},
          capacity_{std::max<size_t>(capacity, 1)},
          clock_{std::move(clock)},
          logger_{std::move(logger)} {}

    bool matches(const NotificationEvent &event) const {
      return filter_.matches(event);
    }

    void push(const NotificationEvent &event) {
      std::lock_guard lock{mutex_};
      if (closed_) {
        return;
      }
      if (queue_.size() >= capacity_) {
        queue_.pop_front();
        ++pending_drops_;
        ++total_drops_;
      }
      queue_.push_back(event);
      if (not scheduled_) {
        scheduled_ = true;
        boost::asio::post(*thread_.io, [this] { drain(); });
      }
    }

    /**
     * Stops accepting events
     * @param deliver_queued - let the consumer finish queued events first
     */
    void close(bool deliver_queued) {
      {
        std::lock_guard lock{mutex_};
        closed_ = true;
        if (not deliver_queued) {
          discard_ = true;
          queue_.clear();
          pending_drops_ = 0;
        }
      }
      thread_.join();
    }

    bool isConsumerThread() const {
      return thread_.isCurrent();
    }

    uint64_t dropped() const {
      std::lock_guard lock{mutex_};
      return total_drops_;
    }

   private:
    void drain() {
      while (true) {
        NotificationEvent event;
        {
          std::lock_guard lock{mutex_};
          if (discard_) {
            scheduled_ = false;
            return;
          }
          if (pending_drops_ != 0) {
            event.kind = EventKind::kEventsDropped;
            event.payload = EventsDropped{pending_drops_};
            event.timestamp = clock_->nowMicro();
            pending_drops_ = 0;
          } else if (queue_.empty()) {
            scheduled_ = false;
            return;
          } else {
            event = std::move(queue_.front());
            queue_.pop_front();
          }
        }
        deliver(event);
      }
    }

    void deliver(const NotificationEvent &event) {
      try {
        handler_(event);
      } catch (const std::exception &e) {
        logger_->error("subscriber {} failed on {}: {}",
                       id_,
                       toString(event.kind),
                       e.what());
      }
    }

    SubscriptionId id_;
    SubscriptionFilter filter_;
    EventHandler handler_;
    size_t capacity_;
    std::shared_ptr<clock::UTCClock> clock_;
    common::Logger logger_;

    mutable std::mutex mutex_;
    std::deque<NotificationEvent> queue_;
    uint64_t pending_drops_{};
    uint64_t total_drops_{};
    bool scheduled_{false};
    bool closed_{false};
    bool discard_{false};

    // last member, joined first
    IoThread thread_;
  };

  NotificationBus::NotificationBus(BusConfig config,
                                   std::shared_ptr<clock::UTCClock> clock)
      : config_{config},
        clock_{std::move(clock)},
        logger_{common::createLogger("NotificationBus")} {}

  NotificationBus::~NotificationBus() {
    stop();
  }

  SubscriptionId NotificationBus::subscribe(SubscriptionFilter filter,
                                            EventHandler handler) {
    std::unique_lock lock{mutex_};
    const auto id{next_id_++};
    if (stopped_) {
      logger_->warn("subscribe after stop, subscription {} stays idle", id);
      return id;
    }
    subscribers_.emplace(id,
                         std::make_shared<Subscriber>(id,
                                                      std::move(filter),
                                                      std::move(handler),
                                                      config_.queue_capacity,
                                                      clock_,
                                                      logger_));
    logger_->debug("subscription {} added", id);
    return id;
  }

  void NotificationBus::unsubscribe(SubscriptionId id) {
    std::shared_ptr<Subscriber> subscriber;
    {
      std::unique_lock lock{mutex_};
      auto it{subscribers_.find(id)};
      if (it == subscribers_.end()) {
        return;
      }
      subscriber = std::move(it->second);
      subscribers_.erase(it);
      if (subscriber->isConsumerThread()) {
        retired_.push_back(subscriber);
      }
    }
    subscriber->close(false);
    logger_->debug("subscription {} removed", id);
  }

  void NotificationBus::publish(NotificationEvent event) {
    std::shared_lock lock{mutex_};
    if (stopped_) {
      logger_->debug("bus stopped, {} not published", toString(event.kind));
      return;
    }
    for (auto &[id, subscriber] : subscribers_) {
      if (subscriber->matches(event)) {
        subscriber->push(event);
      }
    }
  }

  outcome::result<uint64_t> NotificationBus::droppedCount(
      SubscriptionId id) const {
    std::shared_lock lock{mutex_};
    auto it{subscribers_.find(id)};
    if (it == subscribers_.end()) {
      return NotificationBusError::kUnknownSubscription;
    }
    return it->second->dropped();
  }

  size_t NotificationBus::subscriberCount() const {
    std::shared_lock lock{mutex_};
    return subscribers_.size();
  }

  void NotificationBus::stop() {
    std::map<SubscriptionId, std::shared_ptr<Subscriber>> subscribers;
    std::vector<std::shared_ptr<Subscriber>> retired;
    {
      std::unique_lock lock{mutex_};
      if (stopped_) {
        return;
      }
      stopped_ = true;
      subscribers.swap(subscribers_);
      retired.swap(retired_);
    }
    for (auto &[id, subscriber] : subscribers) {
      subscriber->close(true);
    }
    logger_->debug("stopped, {} subscription(s) closed", subscribers.size());
  }

}  // namespace ferry::notification

OUTCOME_CPP_DEFINE_CATEGORY(ferry::notification, NotificationBusError, e) {
  using ferry::notification::NotificationBusError;
  if (e == NotificationBusError::kUnknownSubscription) {
    return "Unknown subscription";
  }
  return "Unknown notification bus error";
}
