/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <string>

#include <boost/functional/hash.hpp>
#include "common/bytes.hpp"
#include "common/outcome.hpp"

namespace ferry::content {

  /**
   * Opaque immutable content key, produced by the content store addressing
   * scheme
   */
  class ContentId {
   public:
    ContentId() = default;
    explicit ContentId(Bytes key) : key_{std::move(key)} {}

    /// Parses lowercase or uppercase hex
    static outcome::result<ContentId> fromHex(const std::string &hex);

    const Bytes &bytes() const {
      return key_;
    }

    std::string toHex() const {
      return ferry::toHex(key_);
    }

    bool empty() const {
      return key_.empty();
    }

    bool operator==(const ContentId &other) const {
      return key_ == other.key_;
    }
    bool operator!=(const ContentId &other) const {
      return key_ != other.key_;
    }
    bool operator<(const ContentId &other) const {
      return key_ < other.key_;
    }

   private:
    Bytes key_;
  };

  enum class MediaKind {
    kUnknown,
    kAudio,
    kVideo,
    kImage,
    kDocument,
    kData,
  };

  enum class Priority {
    kHigh,
    kNormal,
    kLow,
  };

  /**
   * What a requester wants delivered. Immutable once created, shared by
   * pointer-to-const.
   */
  struct ContentRequest {
    ContentId content_id;
    MediaKind kind{MediaKind::kUnknown};
    /** Size estimate in bytes, 0 when unknown */
    uint64_t size{};
    Priority priority{Priority::kNormal};
    /** Consumer is able to play a real-time stream */
    bool streaming_consumer{};
  };

  /// Audio and video are the kinds a media transport can stream
  inline bool isMediaKind(MediaKind kind) {
    return kind == MediaKind::kAudio || kind == MediaKind::kVideo;
  }

  std::string toString(MediaKind kind);
  std::string toString(Priority priority);

  /// Unrecognized names map to MediaKind::kUnknown
  MediaKind mediaKindFromString(const std::string &name);

  enum class ContentIdError {
    kInvalidHex = 1,
    kEmpty,
  };

}  // namespace ferry::content

namespace std {
  template <>
  struct hash<ferry::content::ContentId> {
    size_t operator()(const ferry::content::ContentId &id) const {
      return boost::hash_range(id.bytes().begin(), id.bytes().end());
    }
  };
}  // namespace std

OUTCOME_HPP_DECLARE_ERROR(ferry::content, ContentIdError);
