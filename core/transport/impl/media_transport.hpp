/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <map>
#include <mutex>

#include "common/logger.hpp"
#include "transport/media_channel.hpp"
#include "transport/transport.hpp"

namespace ferry::transport {

  /**
   * Transport adapter over the real-time media stack.
   * Converts channel statistics to quality metrics and forwards bitrate
   * decisions back to the channel of the session. The channel starts at the
   * bitrate carried by the attempt request.
   */
  class MediaTransport : public Transport,
                         public std::enable_shared_from_this<MediaTransport> {
   public:
    explicit MediaTransport(std::shared_ptr<MediaConnector> connector);

    TransportName name() const override;

    void attempt(AttemptRequest request, AttemptCallback cb) override;

    void applyBitrate(SessionId session_id,
                      const BitrateDecision &decision) override;

    /// Sessions with an open channel
    size_t activeChannels() const;

    /// Stats sample to metric, loss percent becomes fraction
    static QualityMetric toMetric(SessionId session_id,
                                  const MediaStats &stats);

   private:
    void release(SessionId session_id);

    std::shared_ptr<MediaConnector> connector_;
    mutable std::mutex mutex_;
    std::map<SessionId, std::shared_ptr<MediaChannel>> channels_;

    common::Logger logger_;
  };

}  // namespace ferry::transport
