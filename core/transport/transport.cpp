/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "transport/transport.hpp"

namespace ferry::transport {

  std::string toString(TransportName name) {
    switch (name) {
      case TransportName::kPeerStream:
        return "p2p";
      case TransportName::kSocketChannel:
        return "socket";
      case TransportName::kMediaTransport:
        return "media";
    }
    return "unknown";
  }

}  // namespace ferry::transport
