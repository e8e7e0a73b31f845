/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/cancel_token.hpp"

namespace ferry::transport {

  bool CancelToken::cancel() {
    std::vector<Handler> handlers;
    {
      std::lock_guard lock{mutex_};
      if (cancelled_) {
        return false;
      }
      cancelled_ = true;
      handlers.swap(handlers_);
    }
    for (auto &handler : handlers) {
      handler();
    }
    return true;
  }

  bool CancelToken::isCancelled() const {
    std::lock_guard lock{mutex_};
    return cancelled_;
  }

  void CancelToken::onCancel(Handler handler) {
    {
      std::lock_guard lock{mutex_};
      if (not cancelled_) {
        handlers_.push_back(std::move(handler));
        return;
      }
    }
    handler();
  }

}  // namespace ferry::transport
