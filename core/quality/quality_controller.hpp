/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_QUALITY_QUALITY_CONTROLLER_HPP
#define CPP_FERRY_CORE_QUALITY_QUALITY_CONTROLLER_HPP

#include <boost/optional.hpp>

#include "common/logger.hpp"
#include "quality/quality_types.hpp"

namespace ferry::quality {

  struct QualityConfig {
    uint64_t min_bitrate{250'000};
    uint64_t max_bitrate{4'500'000};
    uint64_t initial_bitrate{1'000'000};
    /** Weight of the newest sample in moving averages, (0, 1] */
    double ema_alpha{0.3};
    /** Loss above this decreases the target */
    double loss_threshold{0.05};
    /** Loss at or below this allows increasing the target */
    double near_zero_loss{0.005};
    /** Throughput below target * (1 - margin) decreases the target */
    double throughput_margin{0.2};
    /** Proportional decrease step */
    double decrease_factor{0.15};
    /** Additive increase step, bits per second */
    uint64_t increase_step{100'000};
    /** Consecutive good samples required before an increase */
    uint32_t sustained_samples{3};
  };

  struct QualityUpdate {
    BitrateDecision decision;
    /** Decision differs from the previously published one */
    bool changed{};
  };

  /**
   * Adaptive bitrate state of one streaming session.
   * Owned by the session orchestration, not thread safe.
   */
  class QualityController {
   public:
    QualityController(SessionId session_id, QualityConfig config);

    /**
     * Feeds one sample.
     * Malformed samples are counted and leave the decision untouched.
     * @return current decision and whether it has to be published
     */
    QualityUpdate observe(const QualityMetric &metric);

    const BitrateDecision &current() const {
      return current_;
    }

    size_t anomalies() const {
      return anomalies_;
    }

   private:
    bool isValid(const QualityMetric &metric) const;
    static double average(const boost::optional<double> &avg,
                          double sample,
                          double alpha);

    SessionId session_id_;
    QualityConfig config_;
    boost::optional<double> loss_avg_;
    boost::optional<double> throughput_avg_;
    uint32_t good_samples_{};
    size_t anomalies_{};
    BitrateDecision current_;

    common::Logger logger_;
  };

}  // namespace ferry::quality

#endif  // CPP_FERRY_CORE_QUALITY_QUALITY_CONTROLLER_HPP
