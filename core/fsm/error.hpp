/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_FSM_ERROR_HPP
#define CPP_FERRY_CORE_FSM_ERROR_HPP

#include "common/outcome.hpp"

namespace ferry::fsm {

  enum class FsmError {
    kUnknownEvent = 1,
    kNoTransition,
    kTerminalState,
  };

}

OUTCOME_HPP_DECLARE_ERROR(ferry::fsm, FsmError);

#endif  // CPP_FERRY_CORE_FSM_ERROR_HPP
