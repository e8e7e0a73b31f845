/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "selector/protocol_selector.hpp"

namespace ferry::selector {
  using content::MediaKind;
  using content::Priority;

  ProtocolSelector::ProtocolSelector(SelectorConfig config)
      : config_{config} {}

  TransportName ProtocolSelector::primary(
      const ContentRequest &request) const {
    if (content::isMediaKind(request.kind) && request.streaming_consumer) {
      return TransportName::kMediaTransport;
    }
    // unknown kind is not treated as non-media
    if (request.kind != MediaKind::kUnknown
        && not content::isMediaKind(request.kind)
        && request.size < config_.small_size_threshold
        && request.priority == Priority::kHigh) {
      return TransportName::kSocketChannel;
    }
    return TransportName::kPeerStream;
  }

  std::vector<TransportName> ProtocolSelector::select(
      const ContentRequest &request) const {
    const auto first{primary(request)};
    std::vector<TransportName> order{first};
    for (auto name : transport::kFallbackPriority) {
      if (name != first) {
        order.push_back(name);
      }
    }
    return order;
  }

}  // namespace ferry::selector
