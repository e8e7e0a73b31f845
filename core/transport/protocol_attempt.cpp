/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/protocol_attempt.hpp"

namespace ferry::transport {

  std::string toString(AttemptStatus status) {
    switch (status) {
      case AttemptStatus::kSuccess:
        return "success";
      case AttemptStatus::kTimeout:
        return "timeout";
      case AttemptStatus::kUnavailable:
        return "unavailable";
      case AttemptStatus::kTransportError:
        return "transport-error";
      case AttemptStatus::kCancelled:
        return "cancelled";
    }
    return "unknown";
  }

  std::error_code toError(AttemptStatus status) {
    switch (status) {
      case AttemptStatus::kSuccess:
        return {};
      case AttemptStatus::kTimeout:
        return TransferError::kTransportTimeout;
      case AttemptStatus::kUnavailable:
        return TransferError::kTransportUnavailable;
      case AttemptStatus::kTransportError:
        return TransferError::kTransportError;
      case AttemptStatus::kCancelled:
        return TransferError::kCancelled;
    }
    return TransferError::kTransportError;
  }

  std::string describe(const ProtocolAttempt &attempt) {
    auto text{toString(attempt.transport) + ":" + toString(attempt.status)};
    if (not attempt.error.empty()) {
      text += " (" + attempt.error + ")";
    }
    return text;
  }

}  // namespace ferry::transport
