/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ferry::transport {

  /**
   * @brief Failures a transfer can end with or record per attempt
   */
  enum class TransferError {
    /** Reserved for selection rule validation */
    kSelection = 1,
    kTransportTimeout,
    kTransportUnavailable,
    kTransportError,
    kCancelled,
    /** Duplicate session identifier, fatal to the request only */
    kRegistryConflict,
    /** Every selected transport failed */
    kExhausted,
    /** Orchestrator no longer admits requests */
    kShuttingDown,
  };

}  // namespace ferry::transport

OUTCOME_HPP_DECLARE_ERROR(ferry::transport, TransferError);
