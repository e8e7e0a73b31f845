/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "quality/quality_controller.hpp"

#include <algorithm>
#include <cmath>

namespace ferry::quality {

  QualityController::QualityController(SessionId session_id,
                                       QualityConfig config)
      : session_id_{session_id},
        config_{config},
        logger_{common::createLogger("QualityController")} {
    const auto initial{std::clamp(config_.initial_bitrate,
                                  config_.min_bitrate,
                                  config_.max_bitrate)};
    current_ = {initial, tierForBitrate(initial)};
  }

  QualityUpdate QualityController::observe(const QualityMetric &metric) {
    if (not isValid(metric)) {
      ++anomalies_;
      logger_->warn(
          "session {}: dropped malformed metric (loss {}, throughput {}), {} "
          "anomalies so far",
          session_id_,
          metric.loss_rate,
          metric.throughput,
          anomalies_);
      return {current_, false};
    }

    loss_avg_ = average(loss_avg_, metric.loss_rate, config_.ema_alpha);
    throughput_avg_ =
        average(throughput_avg_, metric.throughput, config_.ema_alpha);

    const auto target{static_cast<double>(current_.target_bitrate)};
    auto next{target};
    if (*loss_avg_ > config_.loss_threshold
        || *throughput_avg_ < target * (1.0 - config_.throughput_margin)) {
      good_samples_ = 0;
      next = target * (1.0 - config_.decrease_factor);
    } else if (*loss_avg_ <= config_.near_zero_loss
               && *throughput_avg_ > target) {
      // hysteresis, a single good sample never raises the rate
      if (++good_samples_ >= config_.sustained_samples) {
        good_samples_ = 0;
        next = target + static_cast<double>(config_.increase_step);
      }
    } else {
      good_samples_ = 0;
    }

    const auto bitrate{std::clamp(static_cast<uint64_t>(std::llround(next)),
                                  config_.min_bitrate,
                                  config_.max_bitrate)};
    BitrateDecision decision{bitrate, tierForBitrate(bitrate)};
    const auto changed{decision != current_};
    if (changed) {
      logger_->debug("session {}: target bitrate {} -> {} ({})",
                     session_id_,
                     current_.target_bitrate,
                     decision.target_bitrate,
                     toString(decision.tier));
      current_ = decision;
    }
    return {current_, changed};
  }

  bool QualityController::isValid(const QualityMetric &metric) const {
    return metric.session_id == session_id_ && std::isfinite(metric.loss_rate)
           && std::isfinite(metric.throughput) && metric.loss_rate >= 0
           && metric.loss_rate <= 1 && metric.throughput >= 0
           && metric.rtt.count() >= 0;
  }

  double QualityController::average(const boost::optional<double> &avg,
                                    double sample,
                                    double alpha) {
    if (not avg) {
      return sample;
    }
    return alpha * sample + (1.0 - alpha) * *avg;
  }

}  // namespace ferry::quality
