/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_FSM_FSM_HPP
#define CPP_FERRY_CORE_FSM_FSM_HPP

#include <functional>
#include <map>
#include <set>
#include <stdexcept>
#include <vector>

#include <boost/optional.hpp>
#include "common/outcome.hpp"
#include "fsm/error.hpp"

/**
 * Generic synchronous finite state machine.
 * The owner serializes calls, the machine itself does not lock.
 */
namespace ferry::fsm {

  /**
   * Container for state transitions caused by an event
   *
   * Initialization methods throw on inconsistent rules. Rules are hardcoded,
   * so a throw means a programming error caught on the first run.
   *
   * Initialization has to be done via sequential calling of from* and to
   * methods.
   *
   * @tparam EventEnumType - enum class with events listed
   * @tparam StateEnumType - enum class with states listed
   */
  template <typename EventEnumType, typename StateEnumType>
  class Transition final {
   public:
    explicit Transition(EventEnumType event) : event_{event} {}

    /// Set source state for a transition
    Transition &from(StateEnumType from_state) {
      if (not intermediary_.empty()) {
        throw std::logic_error(
            "Transition destination state was not set for previous sources.");
      }
      intermediary_.insert(from_state);
      return *this;
    }

    /// Set a list of source states for a transition
    template <typename... States>
    Transition &fromMany(States... states) {
      if (not intermediary_.empty()) {
        throw std::logic_error(
            "Transition destination state was not set for previous sources.");
      }
      (intermediary_.insert(states), ...);
      return *this;
    }

    /// Set destination state for all pending source states
    Transition &to(StateEnumType to_state) {
      if (intermediary_.empty()) {
        throw std::logic_error("Transition source state(s) are not set.");
      }
      for (auto from : intermediary_) {
        if (not transitions_.emplace(from, to_state).second) {
          throw std::logic_error("Transition source state redefinition.");
        }
      }
      intermediary_.clear();
      return *this;
    }

    EventEnumType eventId() const {
      return event_;
    }

    /// Resulting state for the given source state, if the rule applies
    boost::optional<StateEnumType> dispatch(StateEnumType from_state) const {
      auto lookup = transitions_.find(from_state);
      if (transitions_.end() == lookup) {
        return boost::none;
      }
      return lookup->second;
    }

   private:
    EventEnumType event_;
    std::set<StateEnumType> intermediary_;
    std::map<StateEnumType, StateEnumType> transitions_;
  };

  /**
   * State holder driven by a transition table
   * @tparam EventEnumType - enum class with list of events
   * @tparam StateEnumType - enum class with list of states
   */
  template <typename EventEnumType, typename StateEnumType>
  class StateMachine {
   public:
    using TransitionRule = Transition<EventEnumType, StateEnumType>;
    using ActionFunction =
        std::function<void(EventEnumType /* event */,
                           StateEnumType /* transition source state */,
                           StateEnumType /* transition destination state */)>;

    /**
     * @param transition_rules - defines state transitions
     * @param initial - initial state
     * @param terminal - states no event leads out of
     */
    StateMachine(std::vector<TransitionRule> transition_rules,
                 StateEnumType initial,
                 std::set<StateEnumType> terminal)
        : state_{initial}, terminal_{std::move(terminal)} {
      for (auto &rule : transition_rules) {
        auto event = rule.eventId();
        transitions_.emplace(event, std::move(rule));
      }
    }

    /**
     * Resolves destination state without changing current one
     * @return destination state or FsmError
     */
    outcome::result<StateEnumType> peek(EventEnumType event) const {
      if (isTerminal()) {
        return FsmError::kTerminalState;
      }
      auto rule = transitions_.find(event);
      if (transitions_.end() == rule) {
        return FsmError::kUnknownEvent;
      }
      auto to = rule->second.dispatch(state_);
      if (not to) {
        return FsmError::kNoTransition;
      }
      return *to;
    }

    /**
     * Applies an event. Action callback is called before the new state is
     * stored.
     * @return destination state
     */
    outcome::result<StateEnumType> send(EventEnumType event) {
      OUTCOME_TRY(to, peek(event));
      if (any_change_cb_) {
        any_change_cb_.get()(event, state_, to);
      }
      state_ = to;
      return to;
    }

    StateEnumType state() const {
      return state_;
    }

    bool isTerminal() const {
      return terminal_.count(state_) != 0;
    }

    /// Optional. Sets a callback to call on any state transition.
    void setAnyChangeAction(ActionFunction action) {
      any_change_cb_ = std::move(action);
    }

   private:
    StateEnumType state_;
    std::set<StateEnumType> terminal_;
    std::map<EventEnumType, TransitionRule> transitions_;
    boost::optional<ActionFunction> any_change_cb_;
  };

}  // namespace ferry::fsm

#endif  // CPP_FERRY_CORE_FSM_FSM_HPP
