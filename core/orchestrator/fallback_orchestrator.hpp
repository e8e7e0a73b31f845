/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_ORCHESTRATOR_FALLBACK_ORCHESTRATOR_HPP
#define CPP_FERRY_CORE_ORCHESTRATOR_FALLBACK_ORCHESTRATOR_HPP

#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include "clock/utc_clock.hpp"
#include "common/logger.hpp"
#include "common/lru_cache.hpp"
#include "notification/notification_bus.hpp"
#include "orchestrator/transfer_fsm.hpp"
#include "quality/quality_controller.hpp"
#include "registry/session_registry.hpp"
#include "selector/protocol_selector.hpp"
#include "transport/transfer_error.hpp"
#include "transport/transport.hpp"

namespace ferry::orchestrator {
  using clock::milliseconds;
  using content::ContentRequest;
  using notification::NotificationBus;
  using notification::NotificationEvent;
  using registry::SessionInfo;
  using registry::SessionRegistry;
  using registry::TransferSession;
  using selector::ProtocolSelector;
  using transport::AttemptOutcome;
  using transport::AttemptStatus;
  using transport::Delivered;
  using transport::Transport;
  using transport::TransportName;

  struct OrchestratorConfig {
    /** Sessions attempting at once, the rest wait in FIFO order */
    size_t max_concurrent_sessions{16};
    /** Attempt timeout before the size dependent part is added */
    std::map<TransportName, milliseconds> base_timeouts{
        {TransportName::kPeerStream, std::chrono::seconds{30}},
        {TransportName::kSocketChannel, std::chrono::seconds{10}},
        {TransportName::kMediaTransport, std::chrono::seconds{60}},
    };
    /** Slowest acceptable delivery, bytes per second, 0 disables */
    uint64_t min_throughput{256 * 1024};
    milliseconds max_attempt_timeout{std::chrono::minutes{10}};
    /** Terminal sessions kept for status queries */
    size_t finished_history{1024};
    quality::QualityConfig quality;
  };

  /// Final state of a transfer given to the requester
  struct TransferResult {
    SessionInfo session;
    /** Present when the transfer succeeded */
    boost::optional<Delivered> delivered;
  };

  using DoneCallback = std::function<void(const TransferResult &)>;

  /**
   * Drives transfers through the ordered transport chain.
   *
   * Each session runs on its own strand of the shared io_context, so
   * attempts and events of one session are strictly ordered while sessions
   * progress independently. Transports are only known by the Transport
   * interface.
   */
  class FallbackOrchestrator
      : public std::enable_shared_from_this<FallbackOrchestrator> {
   public:
    using Transports = std::map<TransportName, std::shared_ptr<Transport>>;

    FallbackOrchestrator(OrchestratorConfig config,
                         boost::asio::io_context &io,
                         Transports transports,
                         ProtocolSelector selector,
                         std::shared_ptr<SessionRegistry> registry,
                         std::shared_ptr<NotificationBus> bus,
                         std::shared_ptr<clock::UTCClock> clock);

    /**
     * Accepts transfer request. Starts it right away or queues it when the
     * concurrency limit is reached.
     * @param request - content to deliver
     * @param done - optional, called once the session is terminal
     * @return new session id, TransferError::kShuttingDown after shutdown
     */
    outcome::result<SessionId> requestTransfer(ContentRequest request,
                                               DoneCallback done = {});

    /**
     * Session snapshot, live or from finished history
     * @return RegistryError::kNotFound for unknown or evicted ids
     */
    outcome::result<SessionInfo> status(SessionId id) const;

    /**
     * Cancels session. Cancelling a terminal session does nothing.
     * @return RegistryError::kNotFound for unknown ids
     */
    outcome::result<void> cancel(SessionId id);

    /// Sessions registered as attempting a transport
    std::vector<SessionInfo> listActive() const;

    /// Sessions waiting for a free slot
    size_t queuedCount() const;

    /**
     * Stops admission, cancels queued requests and waits for in-flight
     * sessions. Sessions still running after timeout are cancelled.
     * Must not be called from a thread running the io_context.
     * @return true if every session reached terminal state
     */
    bool shutdown(milliseconds timeout);

    /// Attempt deadline for content of given size on given transport
    milliseconds attemptTimeout(TransportName transport,
                                const ContentRequest &request) const;

   private:
    struct Run;
    using RunPtr = std::shared_ptr<Run>;

    void start(const RunPtr &run);
    void startAttempt(const RunPtr &run);
    void onOutcome(const RunPtr &run, uint64_t seq, AttemptOutcome outcome);
    void onTimeout(const RunPtr &run, uint64_t seq);
    void onProgress(const RunPtr &run,
                    uint64_t seq,
                    uint64_t bytes,
                    uint64_t total);
    void onMetric(const RunPtr &run,
                  uint64_t seq,
                  const quality::QualityMetric &metric);
    void succeed(const RunPtr &run, Delivered delivered);
    void fail(const RunPtr &run, AttemptStatus status, std::string detail);
    void abort(const RunPtr &run,
               std::error_code error,
               const std::string &detail);
    void cancelOnStrand(const RunPtr &run);
    void finish(const RunPtr &run, boost::optional<Delivered> delivered);

    /**
     * Publishes the event of a transition, then commits the new state
     */
    void commit(Run &run,
                TransferEvent event,
                boost::optional<NotificationEvent> notification);

    NotificationEvent makeEvent(const Run &run,
                                notification::EventKind kind,
                                notification::EventPayload payload) const;

    OrchestratorConfig config_;
    boost::asio::io_context &io_;
    Transports transports_;
    ProtocolSelector selector_;
    std::shared_ptr<SessionRegistry> registry_;
    std::shared_ptr<NotificationBus> bus_;
    std::shared_ptr<clock::UTCClock> clock_;

    mutable std::mutex mutex_;
    std::condition_variable settled_;
    SessionId next_id_{1};
    /** Queued and active runs */
    std::map<SessionId, RunPtr> runs_;
    std::deque<RunPtr> queue_;
    size_t active_{};
    bool stopping_{false};
    mutable common::LRUCache<SessionId, SessionInfo> finished_;

    common::Logger logger_;
  };

}  // namespace ferry::orchestrator

#endif  // CPP_FERRY_CORE_ORCHESTRATOR_FALLBACK_ORCHESTRATOR_HPP
