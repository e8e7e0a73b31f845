/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/variant.hpp>
#include "common/outcome.hpp"
#include "content/content_request.hpp"

namespace ferry::content {

  /// Handle of a live stream owned by a media stack
  struct StreamHandle {
    std::string stream_id;

    bool operator==(const StreamHandle &other) const {
      return stream_id == other.stream_id;
    }
  };

  /// Either the content bytes or a stream they can be read from
  using ContentData = boost::variant<Bytes, StreamHandle>;

  /**
   * Content store boundary. Addressing and storage format belong to the
   * store implementation.
   */
  class ContentStore {
   public:
    virtual ~ContentStore() = default;

    /**
     * Resolve content identifier
     * @param id - content identifier
     * @return content bytes or stream handle, ContentStoreError::kNotFound if
     * the store does not hold the content
     */
    virtual outcome::result<ContentData> resolve(const ContentId &id) const = 0;
  };

  enum class ContentStoreError {
    kNotFound = 1,
  };

}  // namespace ferry::content

OUTCOME_HPP_DECLARE_ERROR(ferry::content, ContentStoreError);
