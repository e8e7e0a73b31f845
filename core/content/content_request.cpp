/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "content/content_request.hpp"

#include <boost/algorithm/hex.hpp>
#include <boost/algorithm/string/case_conv.hpp>

namespace ferry::content {

  outcome::result<ContentId> ContentId::fromHex(const std::string &hex) {
    if (hex.empty()) {
      return ContentIdError::kEmpty;
    }
    Bytes key;
    try {
      boost::algorithm::unhex(hex, std::back_inserter(key));
    } catch (const boost::algorithm::hex_decode_error &) {
      return ContentIdError::kInvalidHex;
    }
    return ContentId{std::move(key)};
  }

  std::string toString(MediaKind kind) {
    switch (kind) {
      case MediaKind::kAudio:
        return "audio";
      case MediaKind::kVideo:
        return "video";
      case MediaKind::kImage:
        return "image";
      case MediaKind::kDocument:
        return "document";
      case MediaKind::kData:
        return "data";
      case MediaKind::kUnknown:
        break;
    }
    return "unknown";
  }

  std::string toString(Priority priority) {
    switch (priority) {
      case Priority::kHigh:
        return "high";
      case Priority::kNormal:
        return "normal";
      case Priority::kLow:
        return "low";
    }
    return "normal";
  }

  MediaKind mediaKindFromString(const std::string &name) {
    const auto lower{boost::algorithm::to_lower_copy(name)};
    for (auto kind : {MediaKind::kAudio,
                      MediaKind::kVideo,
                      MediaKind::kImage,
                      MediaKind::kDocument,
                      MediaKind::kData}) {
      if (lower == toString(kind)) {
        return kind;
      }
    }
    return MediaKind::kUnknown;
  }

}  // namespace ferry::content

OUTCOME_CPP_DEFINE_CATEGORY(ferry::content, ContentIdError, e) {
  using E = ferry::content::ContentIdError;
  switch (e) {
    case E::kInvalidHex:
      return "Content id is not a valid hex string";
    case E::kEmpty:
      return "Content id is empty";
  }
  return "Unknown content id error";
}
