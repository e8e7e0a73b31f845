/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_TRANSPORT_TRANSPORT_HPP
#define CPP_FERRY_CORE_TRANSPORT_TRANSPORT_HPP

#include <array>
#include <chrono>
#include <functional>
#include <memory>

#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include "common/session_id.hpp"
#include "content/content_request.hpp"
#include "content/content_store.hpp"
#include "quality/quality_types.hpp"
#include "transport/cancel_token.hpp"

namespace ferry::transport {
  using content::ContentData;
  using content::ContentRequest;
  using quality::BitrateDecision;
  using quality::QualityMetric;

  enum class TransportName {
    kPeerStream,
    kSocketChannel,
    kMediaTransport,
  };

  /// Order in which fallback transports follow the primary one
  constexpr std::array<TransportName, 3> kFallbackPriority{
      TransportName::kPeerStream,
      TransportName::kSocketChannel,
      TransportName::kMediaTransport,
  };

  std::string toString(TransportName name);

  /*
   * Attempt outcomes
   */

  struct Delivered {
    ContentData data;
    /** Bytes moved by the transport */
    uint64_t bytes{};
  };

  struct TimedOut {};

  struct Unavailable {
    std::string detail;
  };

  struct Errored {
    std::string detail;
  };

  using AttemptOutcome = boost::variant<Delivered, TimedOut, Unavailable, Errored>;

  using ProgressHandler =
      std::function<void(uint64_t /* bytes */, uint64_t /* total */)>;
  using MetricHandler = std::function<void(const QualityMetric &)>;

  struct AttemptRequest {
    SessionId session_id{};
    std::shared_ptr<const ContentRequest> content;
    /** Transport should give up and report TimedOut after it */
    std::chrono::milliseconds timeout{};
    /** Interrupt of the in-flight attempt, honored best effort */
    std::shared_ptr<CancelToken> cancel;
    /** Optional */
    ProgressHandler on_progress;
    /** Optional, streaming transports report network feedback here */
    MetricHandler on_metric;
    /** Starting target of streaming transports */
    boost::optional<BitrateDecision> bitrate;
  };

  using AttemptCallback = std::function<void(AttemptOutcome)>;

  /**
   * Capability every transport stack adapter provides
   */
  class Transport {
   public:
    virtual ~Transport() = default;

    virtual TransportName name() const = 0;

    /**
     * Starts delivery of the requested content.
     * @param request - what to deliver and how long to try
     * @param cb - called exactly once, from any thread, with the outcome
     */
    virtual void attempt(AttemptRequest request, AttemptCallback cb) = 0;

    /**
     * Forwards a new streaming target to the attempt of the session.
     * Transports without rate control ignore it.
     */
    virtual void applyBitrate(SessionId session_id,
                              const BitrateDecision &decision) {}
  };

}  // namespace ferry::transport

#endif  // CPP_FERRY_CORE_TRANSPORT_TRANSPORT_HPP
