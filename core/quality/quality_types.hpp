/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

#include "common/session_id.hpp"

namespace ferry::quality {

  /// One network feedback sample reported by a streaming transport
  struct QualityMetric {
    SessionId session_id{};
    std::chrono::microseconds rtt{};
    /** Fraction of lost packets, [0, 1] */
    double loss_rate{};
    /** Bits per second */
    double throughput{};
  };

  enum class ResolutionTier {
    kVeryLow,
    kLow,
    kMedium,
    kHigh,
    kVeryHigh,
  };

  struct Resolution {
    uint32_t width{};
    uint32_t height{};
  };

  struct BitrateDecision {
    /** Target encoding rate, bits per second */
    uint64_t target_bitrate{};
    ResolutionTier tier{ResolutionTier::kMedium};

    bool operator==(const BitrateDecision &other) const {
      return target_bitrate == other.target_bitrate && tier == other.tier;
    }
    bool operator!=(const BitrateDecision &other) const {
      return !(*this == other);
    }
  };

  /// Highest preset tier whose nominal bitrate does not exceed the target
  ResolutionTier tierForBitrate(uint64_t bitrate);

  /// Nominal bitrate of a preset tier, bits per second
  uint64_t tierBitrate(ResolutionTier tier);

  Resolution tierResolution(ResolutionTier tier);

  std::string toString(ResolutionTier tier);

}  // namespace ferry::quality
