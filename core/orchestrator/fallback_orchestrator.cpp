/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orchestrator/fallback_orchestrator.hpp"

#include <algorithm>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <fmt/format.h>

#include "common/visitor.hpp"

namespace ferry::orchestrator {
  using notification::EventKind;
  using notification::FailureScope;
  using transport::CancelToken;
  using transport::Errored;
  using transport::TimedOut;
  using transport::Unavailable;

  struct FallbackOrchestrator::Run {
    Run(boost::asio::io_context &io,
        std::shared_ptr<TransferSession> session,
        std::vector<TransportName> order,
        DoneCallback done)
        : strand{boost::asio::make_strand(io)},
          timer{strand},
          session{std::move(session)},
          order{std::move(order)},
          done{std::move(done)} {}

    boost::asio::strand<boost::asio::io_context::executor_type> strand;
    boost::asio::steady_timer timer;
    TransferFsm fsm{makeTransferFsm()};
    std::shared_ptr<TransferSession> session;
    std::vector<TransportName> order;
    size_t next_index{};
    /** Current attempt, results of older attempts are ignored */
    uint64_t attempt_seq{};
    milliseconds timeout{};
    bool attempt_open{false};
    std::shared_ptr<CancelToken> attempt_cancel;
    std::shared_ptr<Transport> transport;
    boost::optional<quality::QualityController> quality;
    bool admitted{false};
    bool registered{false};
    DoneCallback done;
  };

  FallbackOrchestrator::FallbackOrchestrator(
      OrchestratorConfig config,
      boost::asio::io_context &io,
      Transports transports,
      ProtocolSelector selector,
      std::shared_ptr<SessionRegistry> registry,
      std::shared_ptr<NotificationBus> bus,
      std::shared_ptr<clock::UTCClock> clock)
      : config_{std::move(config)},
        io_{io},
        transports_{std::move(transports)},
        selector_{std::move(selector)},
        registry_{std::move(registry)},
        bus_{std::move(bus)},
        clock_{std::move(clock)},
        finished_{std::max<size_t>(config_.finished_history, 1),
                  [](const SessionInfo &info) { return info.id; }},
        logger_{common::createLogger("FallbackOrchestrator")} {
    if (config_.max_concurrent_sessions == 0) {
      config_.max_concurrent_sessions = 1;
    }
  }

  outcome::result<SessionId> FallbackOrchestrator::requestTransfer(
      ContentRequest request, DoneCallback done) {
    auto content{std::make_shared<const ContentRequest>(std::move(request))};
    auto order{selector_.select(*content)};

    RunPtr run;
    bool admitted{false};
    {
      std::lock_guard lock{mutex_};
      if (stopping_) {
        return transport::TransferError::kShuttingDown;
      }
      const auto id{next_id_++};
      run = std::make_shared<Run>(
          io_,
          std::make_shared<TransferSession>(id, content, clock_->nowMicro()),
          std::move(order),
          std::move(done));
      runs_.emplace(id, run);
      if (active_ < config_.max_concurrent_sessions) {
        ++active_;
        run->admitted = admitted = true;
      } else {
        queue_.push_back(run);
      }
    }

    const auto id{run->session->id()};
    logger_->info("session {}: {} {} bytes of {}, primary {}{}",
                  id,
                  content::toString(content->kind),
                  content->size,
                  content->content_id.toHex(),
                  transport::toString(run->order.front()),
                  admitted ? "" : ", queued");
    if (admitted) {
      boost::asio::post(run->strand,
                        [self{shared_from_this()}, run] { self->start(run); });
    }
    return id;
  }

  outcome::result<SessionInfo> FallbackOrchestrator::status(
      SessionId id) const {
    std::lock_guard lock{mutex_};
    auto it{runs_.find(id)};
    if (it != runs_.end()) {
      return it->second->session->snapshot();
    }
    if (auto info{finished_.get(id)}) {
      return *info;
    }
    return registry::RegistryError::kNotFound;
  }

  outcome::result<void> FallbackOrchestrator::cancel(SessionId id) {
    RunPtr run;
    {
      std::lock_guard lock{mutex_};
      auto it{runs_.find(id)};
      if (it == runs_.end()) {
        if (finished_.get(id)) {
          logger_->debug("session {}: already terminal, cancel ignored", id);
          return outcome::success();
        }
        return registry::RegistryError::kNotFound;
      }
      run = it->second;
      auto queued{std::find(queue_.begin(), queue_.end(), run)};
      if (queued != queue_.end()) {
        queue_.erase(queued);
      }
    }
    boost::asio::post(run->strand, [self{shared_from_this()}, run] {
      self->cancelOnStrand(run);
    });
    return outcome::success();
  }

  std::vector<SessionInfo> FallbackOrchestrator::listActive() const {
    return registry_->listActive();
  }

  size_t FallbackOrchestrator::queuedCount() const {
    std::lock_guard lock{mutex_};
    return queue_.size();
  }

  bool FallbackOrchestrator::shutdown(milliseconds timeout) {
    std::vector<RunPtr> queued;
    {
      std::lock_guard lock{mutex_};
      stopping_ = true;
      queued.assign(queue_.begin(), queue_.end());
      queue_.clear();
    }
    logger_->info("shutting down, {} queued request(s) cancelled",
                  queued.size());
    for (auto &run : queued) {
      boost::asio::post(run->strand, [self{shared_from_this()}, run] {
        self->cancelOnStrand(run);
      });
    }

    std::unique_lock lock{mutex_};
    if (settled_.wait_for(lock, timeout, [this] { return runs_.empty(); })) {
      return true;
    }
    std::vector<RunPtr> running;
    for (auto &[id, run] : runs_) {
      running.push_back(run);
    }
    lock.unlock();
    logger_->warn("{} session(s) still running, cancelling", running.size());
    for (auto &run : running) {
      boost::asio::post(run->strand, [self{shared_from_this()}, run] {
        self->cancelOnStrand(run);
      });
    }
    lock.lock();
    return settled_.wait_for(
        lock, timeout, [this] { return runs_.empty(); });
  }

  milliseconds FallbackOrchestrator::attemptTimeout(
      TransportName transport, const ContentRequest &request) const {
    milliseconds timeout{};
    auto base{config_.base_timeouts.find(transport)};
    if (base != config_.base_timeouts.end()) {
      timeout = base->second;
    }
    if (config_.min_throughput != 0) {
      const auto rate{config_.min_throughput};
      timeout += milliseconds{request.size / rate * 1000
                              + request.size % rate * 1000 / rate};
    }
    return std::min(timeout, config_.max_attempt_timeout);
  }

  void FallbackOrchestrator::start(const RunPtr &run) {
    if (run->fsm.isTerminal()) {
      return;
    }
    startAttempt(run);
  }

  void FallbackOrchestrator::startAttempt(const RunPtr &run) {
    auto &session{*run->session};
    const auto id{session.id()};
    const auto first{run->next_index == 0};
    const auto name{run->order[run->next_index++]};

    if (not run->registered) {
      auto registered{registry_->registerSession(run->session)};
      if (not registered) {
        logger_->error("session {}: {}", id, registered.error().message());
        abort(run,
              registered.error() == registry::RegistryError::kConflict
                  ? make_error_code(transport::TransferError::kRegistryConflict)
                  : registered.error(),
              registered.error().message());
        return;
      }
      run->registered = true;
    }

    const auto now{clock_->nowMicro()};
    session.beginAttempt(name, now);
    boost::optional<NotificationEvent> started;
    if (first) {
      started = makeEvent(
          *run,
          EventKind::kTransferStarted,
          notification::TransferStarted{session.request()->content_id, name});
    }
    commit(*run, first ? TransferEvent::kStart : TransferEvent::kRetry, started);

    const auto seq{++run->attempt_seq};
    run->attempt_open = true;
    run->attempt_cancel = std::make_shared<CancelToken>();
    run->quality.reset();

    auto transport{transports_.find(name)};
    if (transport == transports_.end() || not transport->second) {
      run->transport.reset();
      logger_->info("session {}: {} is not configured", id, toString(name));
      boost::asio::post(run->strand, [self{shared_from_this()}, run, seq] {
        self->onOutcome(
            run, seq, Unavailable{"transport not configured"});
      });
      return;
    }
    run->transport = transport->second;

    if (name == TransportName::kMediaTransport) {
      run->quality.emplace(id, config_.quality);
      session.setBitrate(run->quality->current(), now);
    }

    const auto timeout{attemptTimeout(name, *session.request())};
    run->timeout = timeout;
    logger_->debug("session {}: attempt {} on {}, timeout {}ms",
                   id,
                   run->next_index,
                   toString(name),
                   timeout.count());
    run->timer.expires_after(timeout);
    run->timer.async_wait(boost::asio::bind_executor(
        run->strand,
        [self{shared_from_this()}, run, seq](
            const boost::system::error_code &ec) {
          if (ec) {
            return;
          }
          self->onTimeout(run, seq);
        }));

    std::weak_ptr<FallbackOrchestrator> weak{shared_from_this()};
    transport::AttemptRequest request;
    request.session_id = id;
    request.content = session.request();
    request.timeout = timeout;
    request.cancel = run->attempt_cancel;
    request.on_progress = [weak, run, seq](uint64_t bytes, uint64_t total) {
      if (auto self{weak.lock()}) {
        boost::asio::post(run->strand, [self, run, seq, bytes, total] {
          self->onProgress(run, seq, bytes, total);
        });
      }
    };
    if (run->quality) {
      request.bitrate = run->quality->current();
    }
    request.on_metric = [weak, run, seq](const quality::QualityMetric &metric) {
      if (auto self{weak.lock()}) {
        boost::asio::post(run->strand, [self, run, seq, metric] {
          self->onMetric(run, seq, metric);
        });
      }
    };
    run->transport->attempt(
        std::move(request),
        [self{shared_from_this()}, run, seq](AttemptOutcome outcome) {
          boost::asio::post(
              run->strand,
              [self, run, seq, outcome{std::move(outcome)}]() mutable {
                self->onOutcome(run, seq, std::move(outcome));
              });
        });
  }

  void FallbackOrchestrator::onOutcome(const RunPtr &run,
                                       uint64_t seq,
                                       AttemptOutcome outcome) {
    if (seq != run->attempt_seq || not run->attempt_open) {
      logger_->debug("session {}: stale attempt result ignored",
                     run->session->id());
      return;
    }
    run->attempt_open = false;
    run->timer.cancel();
    visit_in_place(
        outcome,
        [&](Delivered &delivered) { succeed(run, std::move(delivered)); },
        [&](const TimedOut &) {
          fail(run, AttemptStatus::kTimeout, "transport reported timeout");
        },
        [&](const Unavailable &unavailable) {
          fail(run, AttemptStatus::kUnavailable, unavailable.detail);
        },
        [&](const Errored &errored) {
          fail(run, AttemptStatus::kTransportError, errored.detail);
        });
  }

  void FallbackOrchestrator::onTimeout(const RunPtr &run, uint64_t seq) {
    if (seq != run->attempt_seq || not run->attempt_open) {
      return;
    }
    run->attempt_open = false;
    run->attempt_cancel->cancel();
    fail(run,
         AttemptStatus::kTimeout,
         fmt::format("no result within {}ms", run->timeout.count()));
  }

  void FallbackOrchestrator::onProgress(const RunPtr &run,
                                        uint64_t seq,
                                        uint64_t bytes,
                                        uint64_t total) {
    if (seq != run->attempt_seq || not run->attempt_open) {
      return;
    }
    auto info{run->session->snapshot()};
    run->session->touch(clock_->nowMicro());
    bus_->publish(makeEvent(
        *run,
        EventKind::kTransferProgress,
        notification::TransferProgress{*info.current_transport, bytes, total}));
  }

  void FallbackOrchestrator::onMetric(const RunPtr &run,
                                      uint64_t seq,
                                      const quality::QualityMetric &metric) {
    if (seq != run->attempt_seq || not run->attempt_open || not run->quality) {
      return;
    }
    auto update{run->quality->observe(metric)};
    const auto now{clock_->nowMicro()};
    run->session->touch(now);
    if (not update.changed) {
      return;
    }
    run->session->setBitrate(update.decision, now);
    bus_->publish(makeEvent(*run,
                            EventKind::kQualityChanged,
                            notification::QualityChanged{
                                TransportName::kMediaTransport,
                                update.decision}));
    run->transport->applyBitrate(run->session->id(), update.decision);
  }

  void FallbackOrchestrator::succeed(const RunPtr &run, Delivered delivered) {
    auto &session{*run->session};
    auto attempt{session.finishAttempt(
        AttemptStatus::kSuccess, {}, clock_->nowMicro())};
    if (not attempt) {
      logger_->error("session {}: {}", session.id(), attempt.error().message());
      return;
    }
    session.setDeliveredBytes(delivered.bytes);
    logger_->info("session {}: delivered {} bytes over {}",
                  session.id(),
                  delivered.bytes,
                  toString(attempt.value().transport));
    commit(*run,
           TransferEvent::kSucceed,
           makeEvent(*run,
                     EventKind::kTransferCompleted,
                     notification::TransferCompleted{attempt.value().transport,
                                                     delivered.bytes,
                                                     session.attemptCount()}));
    finish(run, std::move(delivered));
  }

  void FallbackOrchestrator::fail(const RunPtr &run,
                                  AttemptStatus status,
                                  std::string detail) {
    auto &session{*run->session};
    auto attempt{
        session.finishAttempt(status, std::move(detail), clock_->nowMicro())};
    if (not attempt) {
      logger_->error("session {}: {}", session.id(), attempt.error().message());
      return;
    }
    logger_->info("session {}: attempt failed, {}",
                  session.id(),
                  describe(attempt.value()));

    notification::TransferFailed failed;
    failed.scope = FailureScope::kAttempt;
    failed.transport = attempt.value().transport;
    failed.reasons = {attempt.value()};
    failed.error = transport::toError(status);
    failed.detail = attempt.value().error;
    commit(*run,
           TransferEvent::kFail,
           makeEvent(*run, EventKind::kTransferFailed, std::move(failed)));

    if (run->next_index < run->order.size()) {
      startAttempt(run);
      return;
    }

    auto info{session.snapshot()};
    notification::TransferFailed exhausted;
    exhausted.scope = FailureScope::kSession;
    exhausted.reasons = info.attempts;
    exhausted.error = transport::TransferError::kExhausted;
    exhausted.detail = exhausted.error.message();
    logger_->warn("session {}: all {} transport(s) failed",
                  session.id(),
                  info.attempts.size());
    commit(*run,
           TransferEvent::kExhaust,
           makeEvent(*run, EventKind::kTransferFailed, std::move(exhausted)));
    finish(run, boost::none);
  }

  void FallbackOrchestrator::abort(const RunPtr &run,
                                   std::error_code error,
                                   const std::string &detail) {
    notification::TransferFailed failed;
    failed.scope = FailureScope::kSession;
    failed.reasons = run->session->snapshot().attempts;
    failed.error = error;
    failed.detail = detail;
    commit(*run,
           TransferEvent::kAbort,
           makeEvent(*run, EventKind::kTransferFailed, std::move(failed)));
    finish(run, boost::none);
  }

  void FallbackOrchestrator::cancelOnStrand(const RunPtr &run) {
    if (run->fsm.isTerminal()) {
      return;
    }
    auto &session{*run->session};
    session.markCancelled();
    boost::optional<TransportName> interrupted;
    if (run->attempt_open) {
      run->attempt_open = false;
      run->timer.cancel();
      run->attempt_cancel->cancel();
      auto attempt{session.finishAttempt(AttemptStatus::kCancelled,
                                         "cancelled by request",
                                         clock_->nowMicro())};
      if (attempt) {
        interrupted = attempt.value().transport;
      }
    }
    logger_->info("session {}: cancelled", session.id());

    notification::TransferFailed failed;
    failed.scope = FailureScope::kSession;
    failed.transport = interrupted;
    failed.cancelled = true;
    failed.reasons = session.snapshot().attempts;
    failed.error = transport::TransferError::kCancelled;
    failed.detail = failed.error.message();
    commit(*run,
           TransferEvent::kCancel,
           makeEvent(*run, EventKind::kTransferFailed, std::move(failed)));
    finish(run, boost::none);
  }

  void FallbackOrchestrator::finish(const RunPtr &run,
                                    boost::optional<Delivered> delivered) {
    const auto id{run->session->id()};
    run->timer.cancel();
    run->quality.reset();
    run->transport.reset();
    if (run->registered) {
      registry_->deregister(id);
    }

    TransferResult result{run->session->snapshot(), std::move(delivered)};
    if (run->done) {
      try {
        run->done(result);
      } catch (const std::exception &e) {
        logger_->error("session {}: done callback failed: {}", id, e.what());
      }
      run->done = nullptr;
    }

    RunPtr next;
    {
      std::lock_guard lock{mutex_};
      runs_.erase(id);
      finished_.put(std::make_shared<SessionInfo>(std::move(result.session)));
      if (run->admitted) {
        --active_;
        if (not queue_.empty() && not stopping_) {
          next = queue_.front();
          queue_.pop_front();
          next->admitted = true;
          ++active_;
        }
      }
      settled_.notify_all();
    }
    if (next) {
      logger_->debug("session {}: admitted from queue", next->session->id());
      boost::asio::post(next->strand, [self{shared_from_this()}, next] {
        self->start(next);
      });
    }
  }

  void FallbackOrchestrator::commit(
      Run &run,
      TransferEvent event,
      boost::optional<NotificationEvent> notification) {
    auto to{run.fsm.peek(event)};
    if (not to) {
      logger_->error("session {}: {} rejected in state {}: {}",
                     run.session->id(),
                     toString(event),
                     registry::toString(run.fsm.state()),
                     to.error().message());
      return;
    }
    if (notification) {
      bus_->publish(std::move(*notification));
    }
    auto sent{run.fsm.send(event)};
    if (not sent) {
      logger_->error("session {}: {}", run.session->id(), sent.error().message());
      return;
    }
    run.session->setState(to.value(), clock_->nowMicro());
  }

  NotificationEvent FallbackOrchestrator::makeEvent(
      const Run &run,
      notification::EventKind kind,
      notification::EventPayload payload) const {
    NotificationEvent event;
    event.kind = kind;
    event.session_id = run.session->id();
    event.payload = std::move(payload);
    event.timestamp = clock_->nowMicro();
    return event;
  }

}  // namespace ferry::orchestrator
