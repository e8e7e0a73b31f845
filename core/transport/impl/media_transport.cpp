/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/impl/media_transport.hpp"

#include "transport/attempt_once.hpp"

namespace ferry::transport {

  MediaTransport::MediaTransport(std::shared_ptr<MediaConnector> connector)
      : connector_{std::move(connector)},
        logger_{common::createLogger("MediaTransport")} {}

  TransportName MediaTransport::name() const {
    return TransportName::kMediaTransport;
  }

  QualityMetric MediaTransport::toMetric(SessionId session_id,
                                         const MediaStats &stats) {
    QualityMetric metric;
    metric.session_id = session_id;
    metric.rtt = std::chrono::microseconds{
        static_cast<int64_t>(stats.rtt_ms * 1000)};
    metric.loss_rate = stats.packet_loss_percent / 100;
    metric.throughput = stats.bitrate;
    return metric;
  }

  void MediaTransport::attempt(AttemptRequest request, AttemptCallback cb) {
    const auto id{request.session_id};
    auto done{std::make_shared<AttemptOnce>(std::move(cb))};
    if (not request.bitrate) {
      logger_->error("session {}: no starting bitrate", id);
      (*done)(Errored{"no starting bitrate"});
      return;
    }
    const auto bitrate{*request.bitrate};
    auto channel{connector_->open(*request.content)};
    if (!channel) {
      logger_->debug("session {}: no media path: {}",
                     id,
                     channel.error().message());
      (*done)(Unavailable{channel.error().message()});
      return;
    }
    {
      std::lock_guard lock{mutex_};
      channels_[id] = channel.value();
    }

    std::weak_ptr<MediaTransport> weak{shared_from_this()};
    if (request.cancel) {
      request.cancel->onCancel([weak, id, done, channel{channel.value()}] {
        if ((*done)(Errored{"cancelled"})) {
          channel->stop();
        }
        if (auto self{weak.lock()}) {
          self->release(id);
        }
      });
    }

    MediaChannel::Callbacks callbacks;
    callbacks.on_stats = [id, on_metric{request.on_metric}, done](
                             const MediaStats &stats) {
      if (on_metric && not done->done()) {
        on_metric(toMetric(id, stats));
      }
    };
    callbacks.on_data = [total{request.content->size},
                         on_progress{request.on_progress},
                         done](uint64_t bytes) {
      if (on_progress && not done->done()) {
        on_progress(bytes, total);
      }
    };
    callbacks.on_end = [weak, id, done, size{request.content->size}](
                           outcome::result<content::StreamHandle> end) {
      if (auto self{weak.lock()}) {
        self->release(id);
      }
      if (!end) {
        (*done)(Errored{end.error().message()});
        return;
      }
      (*done)(Delivered{std::move(end.value()), size});
    };
    logger_->debug("session {}: streaming at {} bps",
                   id,
                   bitrate.target_bitrate);
    channel.value()->start(*request.content, bitrate, std::move(callbacks));
  }

  void MediaTransport::applyBitrate(SessionId session_id,
                                    const BitrateDecision &decision) {
    std::shared_ptr<MediaChannel> channel;
    {
      std::lock_guard lock{mutex_};
      auto it{channels_.find(session_id)};
      if (it == channels_.end()) {
        return;
      }
      channel = it->second;
    }
    channel->setTargetBitrate(decision);
  }

  size_t MediaTransport::activeChannels() const {
    std::lock_guard lock{mutex_};
    return channels_.size();
  }

  void MediaTransport::release(SessionId session_id) {
    std::lock_guard lock{mutex_};
    channels_.erase(session_id);
  }

}  // namespace ferry::transport
