/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "orchestrator/transfer_fsm.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace ferry::orchestrator {
  using fsm::FsmError;

  /**
   * @given new transfer
   * @when it fails on two transports and succeeds on the third
   * @then it passes attempting and attempt failed states and ends succeeded
   */
  TEST(TransferFsm, FallbackToSuccess) {
    auto fsm{makeTransferFsm()};
    EXPECT_EQ(fsm.state(), TransferState::kPending);
    EXPECT_OUTCOME_EQ(fsm.send(TransferEvent::kStart),
                      TransferState::kAttempting);
    for (auto i{0}; i < 2; ++i) {
      EXPECT_OUTCOME_EQ(fsm.send(TransferEvent::kFail),
                        TransferState::kAttemptFailed);
      EXPECT_OUTCOME_EQ(fsm.send(TransferEvent::kRetry),
                        TransferState::kAttempting);
    }
    EXPECT_OUTCOME_EQ(fsm.send(TransferEvent::kSucceed),
                      TransferState::kSucceeded);
    EXPECT_TRUE(fsm.isTerminal());
  }

  /**
   * @given last attempt failed
   * @when no transport is left
   * @then transfer is exhausted and nothing leaves that state
   */
  TEST(TransferFsm, Exhaust) {
    auto fsm{makeTransferFsm()};
    EXPECT_OUTCOME_TRUE_1(fsm.send(TransferEvent::kStart));
    EXPECT_OUTCOME_TRUE_1(fsm.send(TransferEvent::kFail));
    EXPECT_OUTCOME_EQ(fsm.send(TransferEvent::kExhaust),
                      TransferState::kExhausted);
    EXPECT_OUTCOME_ERROR(FsmError::kTerminalState,
                         fsm.send(TransferEvent::kCancel));
    EXPECT_OUTCOME_ERROR(FsmError::kTerminalState,
                         fsm.send(TransferEvent::kRetry));
  }

  /**
   * @given transfer in each non-terminal state
   * @when it is cancelled
   * @then it is exhausted
   */
  TEST(TransferFsm, CancelFromAnyActiveState) {
    auto pending{makeTransferFsm()};
    EXPECT_OUTCOME_EQ(pending.send(TransferEvent::kCancel),
                      TransferState::kExhausted);

    auto attempting{makeTransferFsm()};
    EXPECT_OUTCOME_TRUE_1(attempting.send(TransferEvent::kStart));
    EXPECT_OUTCOME_EQ(attempting.send(TransferEvent::kCancel),
                      TransferState::kExhausted);

    auto failed{makeTransferFsm()};
    EXPECT_OUTCOME_TRUE_1(failed.send(TransferEvent::kStart));
    EXPECT_OUTCOME_TRUE_1(failed.send(TransferEvent::kFail));
    EXPECT_OUTCOME_EQ(failed.send(TransferEvent::kCancel),
                      TransferState::kExhausted);
  }

  /**
   * @given transfer
   * @when events come out of order
   * @then they are rejected
   */
  TEST(TransferFsm, InvalidTransitions) {
    auto fsm{makeTransferFsm()};
    EXPECT_OUTCOME_ERROR(FsmError::kNoTransition,
                         fsm.send(TransferEvent::kSucceed));
    EXPECT_OUTCOME_ERROR(FsmError::kNoTransition,
                         fsm.send(TransferEvent::kRetry));
    EXPECT_OUTCOME_TRUE_1(fsm.send(TransferEvent::kStart));
    EXPECT_OUTCOME_ERROR(FsmError::kNoTransition,
                         fsm.send(TransferEvent::kStart));
    EXPECT_OUTCOME_ERROR(FsmError::kNoTransition,
                         fsm.send(TransferEvent::kAbort));
    EXPECT_EQ(fsm.state(), TransferState::kAttempting);
  }

  /**
   * @given pending transfer
   * @when it is aborted
   * @then it is exhausted
   */
  TEST(TransferFsm, Abort) {
    auto fsm{makeTransferFsm()};
    EXPECT_OUTCOME_EQ(fsm.send(TransferEvent::kAbort),
                      TransferState::kExhausted);
  }

}  // namespace ferry::orchestrator
