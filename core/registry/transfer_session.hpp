/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_REGISTRY_TRANSFER_SESSION_HPP
#define CPP_FERRY_CORE_REGISTRY_TRANSFER_SESSION_HPP

#include <memory>
#include <mutex>
#include <vector>

#include <boost/optional.hpp>
#include "clock/time.hpp"
#include "common/outcome.hpp"
#include "common/session_id.hpp"
#include "content/content_request.hpp"
#include "quality/quality_types.hpp"
#include "transport/protocol_attempt.hpp"

namespace ferry::registry {
  using clock::microseconds;
  using content::ContentRequest;
  using quality::BitrateDecision;
  using transport::AttemptStatus;
  using transport::ProtocolAttempt;
  using transport::TransportName;

  /**
   * Transfer lifecycle state.
   * kSucceeded and kExhausted are terminal.
   */
  enum class TransferState {
    kPending,
    kAttempting,
    kAttemptFailed,
    kSucceeded,
    kExhausted,
  };

  std::string toString(TransferState state);

  inline bool isTerminal(TransferState state) {
    return state == TransferState::kSucceeded
           || state == TransferState::kExhausted;
  }

  /// Point-in-time copy of a session
  struct SessionInfo {
    SessionId id{};
    std::shared_ptr<const ContentRequest> request;
    boost::optional<TransportName> current_transport;
    /** Finished attempts in order */
    std::vector<ProtocolAttempt> attempts;
    /** Attempt in progress, status not yet known */
    boost::optional<ProtocolAttempt> in_flight;
    TransferState state{TransferState::kPending};
    microseconds created{};
    microseconds last_activity{};
    /**
     * Streaming decision in effect for the media attempt, cleared when the
     * next attempt begins. Kept after the session ends on media.
     */
    boost::optional<BitrateDecision> bitrate;
    uint64_t delivered_bytes{};
    bool cancelled{};
  };

  /**
   * State of one transfer. Written by the orchestration that owns it,
   * snapshot from any thread.
   */
  class TransferSession {
   public:
    TransferSession(SessionId id,
                    std::shared_ptr<const ContentRequest> request,
                    microseconds created);

    SessionId id() const {
      return id_;
    }

    const std::shared_ptr<const ContentRequest> &request() const {
      return request_;
    }

    /// Makes transport current and opens an in-flight attempt
    /// Opens attempt on the transport, previous bitrate decision is dropped
    void beginAttempt(TransportName transport, microseconds now);

    /**
     * Closes in-flight attempt and appends it to history
     * @return appended attempt or RegistryError::kNoAttemptInFlight
     */
    outcome::result<ProtocolAttempt> finishAttempt(AttemptStatus status,
                                                   std::string error,
                                                   microseconds now);

    void setState(TransferState state, microseconds now);
    void setBitrate(const BitrateDecision &decision, microseconds now);
    void setDeliveredBytes(uint64_t bytes);
    void markCancelled();
    void touch(microseconds now);

    TransferState state() const;
    bool hasAttemptInFlight() const;
    size_t attemptCount() const;

    SessionInfo snapshot() const;

   private:
    mutable std::mutex mutex_;
    const SessionId id_;
    const std::shared_ptr<const ContentRequest> request_;
    const microseconds created_;
    boost::optional<TransportName> current_transport_;
    std::vector<ProtocolAttempt> attempts_;
    boost::optional<ProtocolAttempt> in_flight_;
    TransferState state_{TransferState::kPending};
    microseconds last_activity_;
    boost::optional<BitrateDecision> bitrate_;
    uint64_t delivered_bytes_{};
    bool cancelled_{};
  };

}  // namespace ferry::registry

#endif  // CPP_FERRY_CORE_REGISTRY_TRANSFER_SESSION_HPP
