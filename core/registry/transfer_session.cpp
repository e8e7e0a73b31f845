/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/transfer_session.hpp"

#include "registry/registry_error.hpp"

namespace ferry::registry {

  std::string toString(TransferState state) {
    switch (state) {
      case TransferState::kPending:
        return "pending";
      case TransferState::kAttempting:
        return "attempting";
      case TransferState::kAttemptFailed:
        return "attempt_failed";
      case TransferState::kSucceeded:
        return "succeeded";
      case TransferState::kExhausted:
        return "exhausted";
    }
    return "unknown";
  }

  TransferSession::TransferSession(SessionId id,
                                   std::shared_ptr<const ContentRequest> request,
                                   microseconds created)
      : id_{id},
        request_{std::move(request)},
        created_{created},
        last_activity_{created} {}

  void TransferSession::beginAttempt(TransportName transport,
                                     microseconds now) {
    std::lock_guard lock{mutex_};
    current_transport_ = transport;
    bitrate_ = boost::none;
    ProtocolAttempt attempt;
    attempt.transport = transport;
    attempt.started = now;
    in_flight_ = std::move(attempt);
    last_activity_ = now;
  }

  outcome::result<ProtocolAttempt> TransferSession::finishAttempt(
      AttemptStatus status, std::string error, microseconds now) {
    std::lock_guard lock{mutex_};
    if (not in_flight_) {
      return RegistryError::kNoAttemptInFlight;
    }
    auto attempt{std::move(*in_flight_)};
    in_flight_.reset();
    attempt.ended = now;
    attempt.status = status;
    attempt.error = std::move(error);
    attempts_.push_back(attempt);
    last_activity_ = now;
    return attempt;
  }

  void TransferSession::setState(TransferState state, microseconds now) {
    std::lock_guard lock{mutex_};
    state_ = state;
    last_activity_ = now;
  }

  void TransferSession::setBitrate(const BitrateDecision &decision,
                                   microseconds now) {
    std::lock_guard lock{mutex_};
    bitrate_ = decision;
    last_activity_ = now;
  }

  void TransferSession::setDeliveredBytes(uint64_t bytes) {
    std::lock_guard lock{mutex_};
    delivered_bytes_ = bytes;
  }

  void TransferSession::markCancelled() {
    std::lock_guard lock{mutex_};
    cancelled_ = true;
  }

  void TransferSession::touch(microseconds now) {
    std::lock_guard lock{mutex_};
    last_activity_ = now;
  }

  TransferState TransferSession::state() const {
    std::lock_guard lock{mutex_};
    return state_;
  }

  bool TransferSession::hasAttemptInFlight() const {
    std::lock_guard lock{mutex_};
    return in_flight_.has_value();
  }

  size_t TransferSession::attemptCount() const {
    std::lock_guard lock{mutex_};
    return attempts_.size();
  }

  SessionInfo TransferSession::snapshot() const {
    std::lock_guard lock{mutex_};
    SessionInfo info;
    info.id = id_;
    info.request = request_;
    info.current_transport = current_transport_;
    info.attempts = attempts_;
    info.in_flight = in_flight_;
    info.state = state_;
    info.created = created_;
    info.last_activity = last_activity_;
    info.bitrate = bitrate_;
    info.delivered_bytes = delivered_bytes_;
    info.cancelled = cancelled_;
    return info;
  }

}  // namespace ferry::registry
