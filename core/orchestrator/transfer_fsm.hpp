/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "fsm/fsm.hpp"
#include "registry/transfer_session.hpp"

namespace ferry::orchestrator {
  using registry::TransferState;

  enum class TransferEvent {
    /** First transport attempt begins */
    kStart,
    kSucceed,
    kFail,
    /** Next transport attempt begins */
    kRetry,
    /** No transports left */
    kExhaust,
    kCancel,
    /** Request cannot proceed, e.g. its id is taken */
    kAbort,
  };

  using TransferFsm = fsm::StateMachine<TransferEvent, TransferState>;

  std::string toString(TransferEvent event);

  /// Transition table of a transfer lifecycle
  std::vector<TransferFsm::TransitionRule> makeTransferTransitions();

  /// Machine in kPending state
  TransferFsm makeTransferFsm();

}  // namespace ferry::orchestrator
