/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orchestrator/transfer_fsm.hpp"

namespace ferry::orchestrator {
  using Rule = TransferFsm::TransitionRule;

  std::string toString(TransferEvent event) {
    switch (event) {
      case TransferEvent::kStart:
        return "start";
      case TransferEvent::kSucceed:
        return "succeed";
      case TransferEvent::kFail:
        return "fail";
      case TransferEvent::kRetry:
        return "retry";
      case TransferEvent::kExhaust:
        return "exhaust";
      case TransferEvent::kCancel:
        return "cancel";
      case TransferEvent::kAbort:
        return "abort";
    }
    return "unknown";
  }

  std::vector<TransferFsm::TransitionRule> makeTransferTransitions() {
    return {
        Rule(TransferEvent::kStart)
            .from(TransferState::kPending)
            .to(TransferState::kAttempting),
        Rule(TransferEvent::kSucceed)
            .from(TransferState::kAttempting)
            .to(TransferState::kSucceeded),
        Rule(TransferEvent::kFail)
            .from(TransferState::kAttempting)
            .to(TransferState::kAttemptFailed),
        Rule(TransferEvent::kRetry)
            .from(TransferState::kAttemptFailed)
            .to(TransferState::kAttempting),
        Rule(TransferEvent::kExhaust)
            .from(TransferState::kAttemptFailed)
            .to(TransferState::kExhausted),
        Rule(TransferEvent::kCancel)
            .fromMany(TransferState::kPending,
                      TransferState::kAttempting,
                      TransferState::kAttemptFailed)
            .to(TransferState::kExhausted),
        Rule(TransferEvent::kAbort)
            .fromMany(TransferState::kPending, TransferState::kAttemptFailed)
            .to(TransferState::kExhausted),
    };
  }

  TransferFsm makeTransferFsm() {
    return TransferFsm{makeTransferTransitions(),
                       TransferState::kPending,
                       {TransferState::kSucceeded, TransferState::kExhausted}};
  }

}  // namespace ferry::orchestrator
