/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "notification/notification_event.hpp"

#include <boost/algorithm/string/join.hpp>
#include <fmt/format.h>

#include "common/visitor.hpp"

namespace ferry::notification {

  std::string toString(EventKind kind) {
    switch (kind) {
      case EventKind::kTransferStarted:
        return "TRANSFER_STARTED";
      case EventKind::kTransferProgress:
        return "TRANSFER_PROGRESS";
      case EventKind::kTransferCompleted:
        return "TRANSFER_COMPLETED";
      case EventKind::kTransferFailed:
        return "TRANSFER_FAILED";
      case EventKind::kQualityChanged:
        return "QUALITY_CHANGED";
      case EventKind::kContentAdded:
        return "CONTENT_ADDED";
      case EventKind::kContentRemoved:
        return "CONTENT_REMOVED";
      case EventKind::kPinStatusChanged:
        return "PIN_STATUS_CHANGED";
      case EventKind::kEventsDropped:
        return "EVENTS_DROPPED";
    }
    return "UNKNOWN";
  }

  std::string describe(const NotificationEvent &event) {
    auto details = visit_in_place(
        event.payload,
        [](const TransferStarted &started) {
          return fmt::format("{} via {}",
                             started.content_id.toHex(),
                             transport::toString(started.transport));
        },
        [](const TransferProgress &progress) {
          return fmt::format("{} {}/{} bytes",
                             transport::toString(progress.transport),
                             progress.bytes,
                             progress.total);
        },
        [](const TransferCompleted &completed) {
          return fmt::format("{} bytes via {} after {} attempt(s)",
                             completed.bytes,
                             transport::toString(completed.transport),
                             completed.attempts);
        },
        [](const TransferFailed &failed) {
          std::vector<std::string> reasons;
          for (const auto &attempt : failed.reasons) {
            reasons.push_back(transport::describe(attempt));
          }
          return fmt::format(
              "{}{} [{}]{}",
              failed.scope == FailureScope::kSession ? "session" : "attempt",
              failed.cancelled ? " cancelled" : "",
              boost::algorithm::join(reasons, ", "),
              failed.detail.empty() ? "" : " " + failed.detail);
        },
        [](const QualityChanged &changed) {
          return fmt::format("{} {} bps {}",
                             transport::toString(changed.transport),
                             changed.decision.target_bitrate,
                             quality::toString(changed.decision.tier));
        },
        [](const ContentChanged &changed) {
          return changed.content_id.toHex();
        },
        [](const PinStatusChanged &pin) {
          return fmt::format("{} {}",
                             pin.content_id.toHex(),
                             pin.pinned ? "pinned" : "unpinned");
        },
        [](const EventsDropped &dropped) {
          return fmt::format("{} event(s)", dropped.count);
        });
    if (event.session_id) {
      return fmt::format(
          "{} session {}: {}", toString(event.kind), *event.session_id, details);
    }
    return fmt::format("{}: {}", toString(event.kind), details);
  }

}  // namespace ferry::notification
