/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_TEST_TESTUTIL_MOCKS_CLOCK_UTC_CLOCK_MOCK_HPP
#define CPP_FERRY_TEST_TESTUTIL_MOCKS_CLOCK_UTC_CLOCK_MOCK_HPP

#include <gmock/gmock.h>

#include "clock/utc_clock.hpp"

namespace ferry::clock {
  class UTCClockMock : public UTCClock {
   public:
    MOCK_CONST_METHOD0(nowMicro, microseconds());
  };
}  // namespace ferry::clock

#endif  // CPP_FERRY_TEST_TESTUTIL_MOCKS_CLOCK_UTC_CLOCK_MOCK_HPP
