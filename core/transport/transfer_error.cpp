/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/transfer_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ferry::transport, TransferError, e) {
  using E = ferry::transport::TransferError;
  switch (e) {
    case E::kSelection:
      return "Transport selection failed";
    case E::kTransportTimeout:
      return "Transport attempt timed out";
    case E::kTransportUnavailable:
      return "Transport unavailable";
    case E::kTransportError:
      return "Transport error";
    case E::kCancelled:
      return "Transfer cancelled";
    case E::kRegistryConflict:
      return "Session identifier already registered";
    case E::kExhausted:
      return "All transports failed";
    case E::kShuttingDown:
      return "Transfer orchestrator is shutting down";
  }
  return "Unknown transfer error";
}
