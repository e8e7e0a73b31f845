/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_REGISTRY_SESSION_REGISTRY_HPP
#define CPP_FERRY_CORE_REGISTRY_SESSION_REGISTRY_HPP

#include <map>
#include <shared_mutex>

#include "common/logger.hpp"
#include "registry/registry_error.hpp"
#include "registry/transfer_session.hpp"

namespace ferry::registry {

  /**
   * Process wide table of active transfers
   */
  class SessionRegistry {
   public:
    /**
     * Adds session
     * @return RegistryError::kConflict if the id is taken
     */
    outcome::result<void> registerSession(
        std::shared_ptr<const TransferSession> session);

    /// Removes session, unknown id is ignored
    void deregister(SessionId id);

    bool contains(SessionId id) const;

    /// @return snapshot or RegistryError::kNotFound
    outcome::result<SessionInfo> get(SessionId id) const;

    /// Snapshots of all registered sessions ordered by id
    std::vector<SessionInfo> listActive() const;

    size_t size() const;

   private:
    mutable std::shared_mutex mutex_;
    std::map<SessionId, std::shared_ptr<const TransferSession>> sessions_;

    common::Logger logger_{common::createLogger("SessionRegistry")};
  };

}  // namespace ferry::registry

#endif  // CPP_FERRY_CORE_REGISTRY_SESSION_REGISTRY_HPP
