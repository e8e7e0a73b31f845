/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/time.hpp"

namespace ferry::clock {
  /**
   * Wall clock source of session and event timestamps
   */
  class UTCClock {
   public:
    virtual ~UTCClock() = default;

    /// Microseconds since unix epoch
    virtual microseconds nowMicro() const = 0;
  };
}  // namespace ferry::clock
