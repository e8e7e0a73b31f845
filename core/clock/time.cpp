/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "clock/time.hpp"

#include <boost/date_time/posix_time/posix_time.hpp>

namespace ferry::clock {
  std::string microTimeToString(microseconds time) {
    static const boost::posix_time::ptime kEpoch{
        boost::gregorian::date{1970, 1, 1}};
    const auto ptime{kEpoch + boost::posix_time::microseconds{time.count()}};
    return boost::posix_time::to_iso_extended_string(ptime) + "Z";
  }
}  // namespace ferry::clock
