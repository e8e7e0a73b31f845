/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <chrono>
#include <string>

namespace ferry::clock {
  using std::chrono::microseconds;
  using std::chrono::milliseconds;

  /// ISO-8601 UTC, fraction only when non-zero: "2021-01-01T00:00:00.000250Z"
  std::string microTimeToString(microseconds time);
}  // namespace ferry::clock
