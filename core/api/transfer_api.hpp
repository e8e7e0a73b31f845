/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <functional>
#include <tuple>

#include "clock/utc_clock.hpp"
#include "notification/notification_bus.hpp"
#include "orchestrator/fallback_orchestrator.hpp"

#define API_METHOD(_name, _result, ...)                                    \
  struct _##_name : std::function<outcome::result<_result>(__VA_ARGS__)> { \
    using function::function;                                              \
    using Result = _result;                                                \
    using Params = ParamsTuple<__VA_ARGS__>;                               \
    static constexpr auto name = "Ferry." #_name;                          \
  } _name;

namespace ferry::api {
  using content::ContentId;
  using content::ContentRequest;
  using registry::SessionInfo;

  template <typename... T>
  using ParamsTuple =
      std::tuple<std::remove_const_t<std::remove_reference_t<T>>...>;

  /**
   * Administrative surface of the transfer core
   */
  struct TransferApi {
    /// Starts or queues a transfer, returns its session id
    API_METHOD(RequestTransfer, SessionId, const ContentRequest &)
    API_METHOD(TransferStatus, SessionInfo, SessionId)
    /// Idempotent, terminal sessions are left untouched
    API_METHOD(CancelTransfer, void, SessionId)
    API_METHOD(ListActiveTransfers, std::vector<SessionInfo>)

    /*
     * Content store lifecycle, re-published on the notification bus
     */

    API_METHOD(NotifyContentAdded, void, const ContentId &)
    API_METHOD(NotifyContentRemoved, void, const ContentId &)
    API_METHOD(NotifyPinStatus, void, const ContentId &, bool)
  };

  template <typename A, typename F>
  void visit(A &&a, const F &f) {
    f(a.RequestTransfer);
    f(a.TransferStatus);
    f(a.CancelTransfer);
    f(a.ListActiveTransfers);
    f(a.NotifyContentAdded);
    f(a.NotifyContentRemoved);
    f(a.NotifyPinStatus);
  }

  enum class ApiError {
    kUnknownSession = 1,
    kInvalidRequest,
  };

  std::shared_ptr<TransferApi> makeTransferApi(
      std::shared_ptr<orchestrator::FallbackOrchestrator> orchestrator,
      std::shared_ptr<notification::NotificationBus> bus,
      std::shared_ptr<clock::UTCClock> clock);

}  // namespace ferry::api

OUTCOME_HPP_DECLARE_ERROR(ferry::api, ApiError);
