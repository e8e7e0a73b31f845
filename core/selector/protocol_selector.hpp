/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <vector>

#include "content/content_request.hpp"
#include "transport/transport.hpp"

namespace ferry::selector {
  using content::ContentRequest;
  using transport::TransportName;

  struct SelectorConfig {
    /** Non-media content below this size may use the socket channel */
    uint64_t small_size_threshold{1 << 20};
  };

  /**
   * Ranks transports for a request. Pure function of the request and the
   * static rules, never fails.
   */
  class ProtocolSelector {
   public:
    explicit ProtocolSelector(SelectorConfig config = {});

    /**
     * @return primary transport followed by the remaining transports in
     * fallback priority order, each transport exactly once
     */
    std::vector<TransportName> select(const ContentRequest &request) const;

    /// Transport the rules pick as primary
    TransportName primary(const ContentRequest &request) const;

    const SelectorConfig &config() const {
      return config_;
    }

   private:
    SelectorConfig config_;
  };

}  // namespace ferry::selector
