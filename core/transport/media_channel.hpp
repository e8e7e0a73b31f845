/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <memory>

#include "common/outcome.hpp"
#include "content/content_store.hpp"
#include "quality/quality_types.hpp"

namespace ferry::transport {

  /// Network statistics as reported by the real-time media stack
  struct MediaStats {
    double rtt_ms{};
    /** Percent, [0, 100] */
    double packet_loss_percent{};
    /** Bits per second */
    double bitrate{};
  };

  /**
   * One real-time stream of the media stack
   */
  class MediaChannel {
   public:
    struct Callbacks {
      std::function<void(const MediaStats &)> on_stats;
      /** Total bytes streamed so far */
      std::function<void(uint64_t)> on_data;
      /** Called once when the stream ended or failed */
      std::function<void(outcome::result<content::StreamHandle>)> on_end;
    };

    virtual ~MediaChannel() = default;

    virtual void start(const content::ContentRequest &request,
                       const quality::BitrateDecision &initial,
                       Callbacks callbacks) = 0;

    virtual void setTargetBitrate(const quality::BitrateDecision &decision) = 0;

    /// Ends stream early, on_end is not called after it
    virtual void stop() = 0;
  };

  /**
   * Opens channels to the peer holding content
   */
  class MediaConnector {
   public:
    virtual ~MediaConnector() = default;

    /// @return channel or error when no media path is available
    virtual outcome::result<std::shared_ptr<MediaChannel>> open(
        const content::ContentRequest &request) = 0;
  };

}  // namespace ferry::transport
