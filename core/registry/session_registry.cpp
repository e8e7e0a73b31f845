/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/session_registry.hpp"

#include <mutex>

namespace ferry::registry {

  outcome::result<void> SessionRegistry::registerSession(
      std::shared_ptr<const TransferSession> session) {
    std::unique_lock lock{mutex_};
    const auto id{session->id()};
    if (not sessions_.emplace(id, std::move(session)).second) {
      logger_->warn("session {} is already registered", id);
      return RegistryError::kConflict;
    }
    logger_->debug("session {} registered, {} active", id, sessions_.size());
    return outcome::success();
  }

  void SessionRegistry::deregister(SessionId id) {
    std::unique_lock lock{mutex_};
    if (sessions_.erase(id) != 0) {
      logger_->debug(
          "session {} deregistered, {} active", id, sessions_.size());
    }
  }

  bool SessionRegistry::contains(SessionId id) const {
    std::shared_lock lock{mutex_};
    return sessions_.count(id) != 0;
  }

  outcome::result<SessionInfo> SessionRegistry::get(SessionId id) const {
    std::shared_ptr<const TransferSession> session;
    {
      std::shared_lock lock{mutex_};
      auto it{sessions_.find(id)};
      if (it == sessions_.end()) {
        return RegistryError::kNotFound;
      }
      session = it->second;
    }
    return session->snapshot();
  }

  std::vector<SessionInfo> SessionRegistry::listActive() const {
    std::vector<SessionInfo> result;
    std::shared_lock lock{mutex_};
    result.reserve(sessions_.size());
    for (auto &[id, session] : sessions_) {
      result.push_back(session->snapshot());
    }
    return result;
  }

  size_t SessionRegistry::size() const {
    std::shared_lock lock{mutex_};
    return sessions_.size();
  }

}  // namespace ferry::registry
