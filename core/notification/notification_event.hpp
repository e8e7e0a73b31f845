/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_NOTIFICATION_NOTIFICATION_EVENT_HPP
#define CPP_FERRY_CORE_NOTIFICATION_NOTIFICATION_EVENT_HPP

#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include "clock/time.hpp"
#include "common/session_id.hpp"
#include "content/content_request.hpp"
#include "quality/quality_types.hpp"
#include "transport/protocol_attempt.hpp"

namespace ferry::notification {
  using content::ContentId;
  using quality::BitrateDecision;
  using transport::ProtocolAttempt;
  using transport::TransportName;

  enum class EventKind {
    kTransferStarted,
    kTransferProgress,
    kTransferCompleted,
    kTransferFailed,
    kQualityChanged,
    kContentAdded,
    kContentRemoved,
    kPinStatusChanged,
    /** Marker delivered to a subscriber after its queue overflowed */
    kEventsDropped,
  };

  enum class FailureScope {
    /** One transport attempt failed, the session may continue */
    kAttempt,
    /** The session is over */
    kSession,
  };

  struct TransferStarted {
    ContentId content_id;
    TransportName transport{};
  };

  struct TransferProgress {
    TransportName transport{};
    uint64_t bytes{};
    uint64_t total{};
  };

  struct TransferCompleted {
    TransportName transport{};
    uint64_t bytes{};
    size_t attempts{};
  };

  struct TransferFailed {
    FailureScope scope{};
    /** Failed transport for attempt scope */
    boost::optional<TransportName> transport;
    bool cancelled{};
    /** Attempt scope: the failed attempt, session scope: all attempts */
    std::vector<ProtocolAttempt> reasons;
    /** transport::TransferError classifying the failure */
    std::error_code error;
    std::string detail;
  };

  struct QualityChanged {
    TransportName transport{};
    BitrateDecision decision;
  };

  struct ContentChanged {
    ContentId content_id;
  };

  struct PinStatusChanged {
    ContentId content_id;
    bool pinned{};
  };

  struct EventsDropped {
    uint64_t count{};
  };

  using EventPayload = boost::variant<TransferStarted,
                                      TransferProgress,
                                      TransferCompleted,
                                      TransferFailed,
                                      QualityChanged,
                                      ContentChanged,
                                      PinStatusChanged,
                                      EventsDropped>;

  /**
   * Immutable value published once on the bus
   */
  struct NotificationEvent {
    EventKind kind{};
    /** Absent for events not tied to a transfer */
    boost::optional<SessionId> session_id;
    EventPayload payload;
    clock::microseconds timestamp{};
  };

  std::string toString(EventKind kind);

  /// One line human readable summary, used for logging
  std::string describe(const NotificationEvent &event);

}  // namespace ferry::notification

#endif  // CPP_FERRY_CORE_NOTIFICATION_NOTIFICATION_EVENT_HPP
