/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "clock/utc_clock.hpp"

namespace ferry::clock {
  /// System clock
  class UTCClockImpl : public UTCClock {
   public:
    microseconds nowMicro() const override;
  };
}  // namespace ferry::clock
