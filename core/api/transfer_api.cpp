/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "api/transfer_api.hpp"

namespace ferry::api {
  using notification::ContentChanged;
  using notification::EventKind;
  using notification::NotificationEvent;
  using notification::PinStatusChanged;

  namespace {
    std::error_code mapError(const std::error_code &error) {
      if (error == registry::RegistryError::kNotFound) {
        return make_error_code(ApiError::kUnknownSession);
      }
      return error;
    }
  }  // namespace

  std::shared_ptr<TransferApi> makeTransferApi(
      std::shared_ptr<orchestrator::FallbackOrchestrator> orchestrator,
      std::shared_ptr<notification::NotificationBus> bus,
      std::shared_ptr<clock::UTCClock> clock) {
    auto api{std::make_shared<TransferApi>()};
    auto publish{[bus, clock](EventKind kind,
                              notification::EventPayload payload) {
      NotificationEvent event;
      event.kind = kind;
      event.payload = std::move(payload);
      event.timestamp = clock->nowMicro();
      bus->publish(std::move(event));
    }};

    api->RequestTransfer = [orchestrator](const ContentRequest &request)
        -> outcome::result<SessionId> {
      if (request.content_id.empty()) {
        return ApiError::kInvalidRequest;
      }
      return orchestrator->requestTransfer(request);
    };
    api->TransferStatus =
        [orchestrator](SessionId id) -> outcome::result<SessionInfo> {
      auto status{orchestrator->status(id)};
      if (!status) {
        return mapError(status.error());
      }
      return status;
    };
    api->CancelTransfer = [orchestrator](SessionId id) -> outcome::result<void> {
      auto cancelled{orchestrator->cancel(id)};
      if (!cancelled) {
        return mapError(cancelled.error());
      }
      return outcome::success();
    };
    api->ListActiveTransfers = [orchestrator]() {
      return orchestrator->listActive();
    };
    api->NotifyContentAdded =
        [publish](const ContentId &id) -> outcome::result<void> {
      publish(EventKind::kContentAdded, ContentChanged{id});
      return outcome::success();
    };
    api->NotifyContentRemoved =
        [publish](const ContentId &id) -> outcome::result<void> {
      publish(EventKind::kContentRemoved, ContentChanged{id});
      return outcome::success();
    };
    api->NotifyPinStatus =
        [publish](const ContentId &id, bool pinned) -> outcome::result<void> {
      publish(EventKind::kPinStatusChanged, PinStatusChanged{id, pinned});
      return outcome::success();
    };
    return api;
  }

}  // namespace ferry::api

OUTCOME_CPP_DEFINE_CATEGORY(ferry::api, ApiError, e) {
  using ferry::api::ApiError;
  switch (e) {
    case ApiError::kUnknownSession:
      return "ApiError: unknown transfer session";
    case ApiError::kInvalidRequest:
      return "ApiError: invalid transfer request";
  }
  return "ApiError: unknown error";
}
