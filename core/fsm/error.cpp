/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fsm/error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ferry::fsm, FsmError, e) {
  using E = ferry::fsm::FsmError;
  switch (e) {
    case E::kUnknownEvent:
      return "No transition rule registered for the event.";
    case E::kNoTransition:
      return "Event is not applicable in the current state.";
    case E::kTerminalState:
      return "State machine has reached a terminal state.";
  }
  return "Unknown FSM error";
}
