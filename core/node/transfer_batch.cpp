/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "node/transfer_batch.hpp"

namespace ferry::node {
  using orchestrator::TransferResult;

  TransferBatch::TransferBatch(
      std::shared_ptr<FallbackOrchestrator> orchestrator)
      : orchestrator_{std::move(orchestrator)},
        logger_{common::createLogger("TransferBatch")} {}

  std::vector<SessionId> TransferBatch::request(
      const std::vector<ContentId> &ids) {
    {
      std::lock_guard lock{mutex_};
      expected_ += ids.size();
    }
    std::vector<SessionId> sessions;
    for (const auto &id : ids) {
      content::ContentRequest request;
      request.content_id = id;
      auto session{orchestrator_->requestTransfer(
          std::move(request), [this](const TransferResult &result) {
            add(result.session.state == registry::TransferState::kSucceeded);
          })};
      if (!session) {
        logger_->error("cannot request {}: {}",
                       id.toHex(),
                       session.error().message());
        add(false);
        continue;
      }
      sessions.push_back(session.value());
    }
    return sessions;
  }

  void TransferBatch::wait() {
    std::unique_lock lock{mutex_};
    cv_.wait(lock, [this] { return settled(); });
  }

  bool TransferBatch::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock lock{mutex_};
    return cv_.wait_for(lock, timeout, [this] { return settled(); });
  }

  size_t TransferBatch::succeeded() const {
    std::lock_guard lock{mutex_};
    return succeeded_;
  }

  size_t TransferBatch::failed() const {
    std::lock_guard lock{mutex_};
    return failed_;
  }

  void TransferBatch::add(bool success) {
    std::lock_guard lock{mutex_};
    ++(success ? succeeded_ : failed_);
    cv_.notify_all();
  }

  bool TransferBatch::settled() const {
    return succeeded_ + failed_ >= expected_;
  }

}  // namespace ferry::node
