/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <atomic>

#include "transport/transport.hpp"

namespace ferry::transport {

  /**
   * Attempt callback holder which lets only the first outcome through.
   * Adapters race stack callbacks against cancellation.
   */
  class AttemptOnce {
   public:
    explicit AttemptOnce(AttemptCallback cb) : cb_{std::move(cb)} {}

    /// @return false if an outcome was already reported
    bool operator()(AttemptOutcome outcome) {
      if (done_.exchange(true)) {
        return false;
      }
      cb_(std::move(outcome));
      return true;
    }

    bool done() const {
      return done_;
    }

   private:
    AttemptCallback cb_;
    std::atomic_bool done_{false};
  };

}  // namespace ferry::transport
