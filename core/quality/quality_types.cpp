/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "quality/quality_types.hpp"

#include <array>

namespace ferry::quality {
  namespace {
    struct Preset {
      ResolutionTier tier;
      uint64_t bitrate;
      Resolution resolution;
    };

    // ascending by bitrate
    constexpr std::array<Preset, 5> kPresets{{
        {ResolutionTier::kVeryLow, 250'000, {320, 240}},
        {ResolutionTier::kLow, 500'000, {640, 360}},
        {ResolutionTier::kMedium, 1'000'000, {854, 480}},
        {ResolutionTier::kHigh, 2'500'000, {1280, 720}},
        {ResolutionTier::kVeryHigh, 4'500'000, {1920, 1080}},
    }};

    const Preset &preset(ResolutionTier tier) {
      for (const auto &item : kPresets) {
        if (item.tier == tier) {
          return item;
        }
      }
      return kPresets[2];
    }
  }  // namespace

  ResolutionTier tierForBitrate(uint64_t bitrate) {
    auto tier{ResolutionTier::kVeryLow};
    for (const auto &item : kPresets) {
      if (item.bitrate <= bitrate) {
        tier = item.tier;
      }
    }
    return tier;
  }

  uint64_t tierBitrate(ResolutionTier tier) {
    return preset(tier).bitrate;
  }

  Resolution tierResolution(ResolutionTier tier) {
    return preset(tier).resolution;
  }

  std::string toString(ResolutionTier tier) {
    switch (tier) {
      case ResolutionTier::kVeryLow:
        return "very_low";
      case ResolutionTier::kLow:
        return "low";
      case ResolutionTier::kMedium:
        return "medium";
      case ResolutionTier::kHigh:
        return "high";
      case ResolutionTier::kVeryHigh:
        return "very_high";
    }
    return "medium";
  }
}  // namespace ferry::quality
