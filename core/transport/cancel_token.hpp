/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <mutex>
#include <vector>

namespace ferry::transport {

  /**
   * Cooperative cancellation signal shared between the orchestrator and a
   * transport attempt. Thread safe, cancel is idempotent.
   */
  class CancelToken {
   public:
    using Handler = std::function<void()>;

    /**
     * Raises the signal and runs registered interrupt handlers
     * @return true for the call that actually cancelled
     */
    bool cancel();

    bool isCancelled() const;

    /**
     * Registers an interrupt handler. Runs it immediately when already
     * cancelled.
     */
    void onCancel(Handler handler);

   private:
    mutable std::mutex mutex_;
    bool cancelled_{false};
    std::vector<Handler> handlers_;
  };

}  // namespace ferry::transport
