/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/cancel_token.hpp"

#include <gtest/gtest.h>

#include "transport/attempt_once.hpp"
#include "transport/protocol_attempt.hpp"

namespace ferry::transport {

  /**
   * @given token with handlers
   * @when cancelled twice
   * @then handlers run once, only the first call reports cancelling
   */
  TEST(CancelToken, CancelOnce) {
    CancelToken token;
    auto calls{0};
    token.onCancel([&] { ++calls; });
    token.onCancel([&] { ++calls; });
    EXPECT_FALSE(token.isCancelled());

    EXPECT_TRUE(token.cancel());
    EXPECT_FALSE(token.cancel());
    EXPECT_TRUE(token.isCancelled());
    EXPECT_EQ(calls, 2);
  }

  /**
   * @given cancelled token
   * @when handler is registered
   * @then it runs right away
   */
  TEST(CancelToken, LateHandler) {
    CancelToken token;
    token.cancel();
    auto called{false};
    token.onCancel([&] { called = true; });
    EXPECT_TRUE(called);
  }

  /**
   * @given callback wrapped for a single outcome
   * @when outcomes race
   * @then only the first one reaches the callback
   */
  TEST(AttemptOnce, FirstOutcomeWins) {
    std::vector<AttemptOutcome> outcomes;
    AttemptOnce once{[&](AttemptOutcome outcome) {
      outcomes.push_back(std::move(outcome));
    }};
    EXPECT_FALSE(once.done());
    EXPECT_TRUE(once(Errored{"cancelled"}));
    EXPECT_FALSE(once(Delivered{Bytes{1}, 1}));
    EXPECT_TRUE(once.done());
    ASSERT_EQ(outcomes.size(), 1);
    EXPECT_EQ(boost::get<Errored>(outcomes[0]).detail, "cancelled");
  }

  /**
   * @given finished attempts
   * @then they are summarized as transport and status tags
   */
  TEST(ProtocolAttempt, Describe) {
    ProtocolAttempt attempt;
    attempt.transport = TransportName::kMediaTransport;
    attempt.status = AttemptStatus::kTimeout;
    EXPECT_EQ(describe(attempt), "media:timeout");
    attempt.transport = TransportName::kSocketChannel;
    attempt.status = AttemptStatus::kTransportError;
    attempt.error = "reset";
    EXPECT_EQ(describe(attempt), "socket:transport-error (reset)");
  }

}  // namespace ferry::transport
