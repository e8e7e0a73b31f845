/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "fsm/fsm.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace ferry::fsm {
  enum class Events { START, STOP, RESET };

  enum class States { READY, WORKING, STOPPED };

  using Fsm = StateMachine<Events, States>;
  using TransitionRule = Fsm::TransitionRule;

  class FsmTest : public ::testing::Test {
   public:
    Fsm fsm{{TransitionRule(Events::START)
                 .from(States::READY)
                 .to(States::WORKING),
             TransitionRule(Events::STOP)
                 .fromMany(States::READY, States::WORKING)
                 .to(States::STOPPED)},
            States::READY,
            {States::STOPPED}};
  };

  /**
   * Test pipeline with change callback
   */
  TEST_F(FsmTest, Main) {
    std::vector<std::pair<States, States>> changes;
    fsm.setAnyChangeAction([&](auto, auto from, auto to) {
      EXPECT_EQ(fsm.state(), from);
      changes.emplace_back(from, to);
    });
    EXPECT_OUTCOME_EQ(fsm.send(Events::START), States::WORKING);
    EXPECT_OUTCOME_EQ(fsm.send(Events::STOP), States::STOPPED);
    EXPECT_TRUE(fsm.isTerminal());
    EXPECT_EQ(changes,
              (std::vector<std::pair<States, States>>{
                  {States::READY, States::WORKING},
                  {States::WORKING, States::STOPPED}}));
  }

  /**
   * @given machine in READY state
   * @when event without rule for the state is sent
   * @then error, state is kept
   */
  TEST_F(FsmTest, NoTransition) {
    EXPECT_OUTCOME_TRUE_1(fsm.send(Events::START));
    EXPECT_OUTCOME_ERROR(FsmError::kNoTransition, fsm.send(Events::START));
    EXPECT_OUTCOME_ERROR(FsmError::kUnknownEvent, fsm.send(Events::RESET));
    EXPECT_EQ(fsm.state(), States::WORKING);
  }

  /**
   * @given machine in terminal state
   * @when any event is sent
   * @then it is rejected
   */
  TEST_F(FsmTest, TerminalState) {
    EXPECT_OUTCOME_TRUE_1(fsm.send(Events::STOP));
    EXPECT_OUTCOME_ERROR(FsmError::kTerminalState, fsm.peek(Events::START));
    EXPECT_OUTCOME_ERROR(FsmError::kTerminalState, fsm.send(Events::START));
    EXPECT_EQ(fsm.state(), States::STOPPED);
  }

  /**
   * @given machine
   * @when destination is peeked
   * @then state is not changed
   */
  TEST_F(FsmTest, Peek) {
    EXPECT_OUTCOME_EQ(fsm.peek(Events::START), States::WORKING);
    EXPECT_EQ(fsm.state(), States::READY);
  }

  /**
   * @given inconsistent rule definitions
   * @when rules are built
   * @then logic error is thrown
   */
  TEST(FsmRules, Inconsistent) {
    EXPECT_THROW(TransitionRule(Events::START).to(States::WORKING),
                 std::logic_error);
    EXPECT_THROW(
        TransitionRule(Events::START).from(States::READY).from(States::WORKING),
        std::logic_error);
    EXPECT_THROW(TransitionRule(Events::START)
                     .from(States::READY)
                     .to(States::WORKING)
                     .from(States::READY)
                     .to(States::STOPPED),
                 std::logic_error);
  }

}  // namespace ferry::fsm
