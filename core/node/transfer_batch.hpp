/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_NODE_TRANSFER_BATCH_HPP
#define CPP_FERRY_CORE_NODE_TRANSFER_BATCH_HPP

#include <condition_variable>
#include <mutex>

#include "common/logger.hpp"
#include "orchestrator/fallback_orchestrator.hpp"

namespace ferry::node {
  using content::ContentId;
  using orchestrator::FallbackOrchestrator;

  /**
   * Transfers of a fixed set of content ids. A session is counted once, when
   * the orchestrator reports it terminal.
   */
  class TransferBatch {
   public:
    explicit TransferBatch(std::shared_ptr<FallbackOrchestrator> orchestrator);

    /**
     * Requests transfer of every id, rejected requests are counted failed
     * @return ids of accepted sessions
     */
    std::vector<SessionId> request(const std::vector<ContentId> &ids);

    /// Blocks until every requested id is terminal
    void wait();

    /// @return false if some transfer is still running after timeout
    bool waitFor(std::chrono::milliseconds timeout);

    size_t succeeded() const;
    size_t failed() const;

   private:
    void add(bool success);
    bool settled() const;

    std::shared_ptr<FallbackOrchestrator> orchestrator_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t expected_{};
    size_t succeeded_{};
    size_t failed_{};

    common::Logger logger_;
  };

}  // namespace ferry::node

#endif  // CPP_FERRY_CORE_NODE_TRANSFER_BATCH_HPP
