/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include "clock/time.hpp"
#include "transport/transfer_error.hpp"
#include "transport/transport.hpp"

namespace ferry::transport {

  enum class AttemptStatus {
    kSuccess,
    kTimeout,
    kUnavailable,
    kTransportError,
    kCancelled,
  };

  /**
   * Record of one transport attempt, immutable once appended to a session
   */
  struct ProtocolAttempt {
    TransportName transport{};
    clock::microseconds started{};
    clock::microseconds ended{};
    AttemptStatus status{};
    /** Empty for successful attempts */
    std::string error;
  };

  std::string toString(AttemptStatus status);

  /**
   * Error code classifying the attempt status
   * @return empty code for success
   */
  std::error_code toError(AttemptStatus status);

  /// "media:timeout" style tag used in failure summaries
  std::string describe(const ProtocolAttempt &attempt);

}  // namespace ferry::transport
