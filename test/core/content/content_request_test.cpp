/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "content/content_request.hpp"

#include <gtest/gtest.h>

#include "testutil/outcome.hpp"

namespace ferry::content {

  /**
   * @given hex string in any case
   * @when parsed
   * @then content id holds the bytes and prints lowercase hex
   */
  TEST(ContentId, FromHex) {
    EXPECT_OUTCOME_TRUE(id, ContentId::fromHex("CAfe01"));
    EXPECT_EQ(id.bytes(), (Bytes{0xca, 0xfe, 0x01}));
    EXPECT_EQ(id.toHex(), "cafe01");
    EXPECT_OUTCOME_EQ(ContentId::fromHex("cafe01"), id);
  }

  /**
   * @given malformed strings
   * @when parsed
   * @then error
   */
  TEST(ContentId, Invalid) {
    EXPECT_OUTCOME_ERROR(ContentIdError::kEmpty, ContentId::fromHex(""));
    EXPECT_OUTCOME_ERROR(ContentIdError::kInvalidHex, ContentId::fromHex("abc"));
    EXPECT_OUTCOME_ERROR(ContentIdError::kInvalidHex,
                         ContentId::fromHex("zz"));
  }

  /**
   * @given media kind names
   * @then they map both ways, unknown names map to unknown kind
   */
  TEST(ContentRequest, MediaKindNames) {
    EXPECT_EQ(mediaKindFromString("Video"), MediaKind::kVideo);
    EXPECT_EQ(mediaKindFromString("document"), MediaKind::kDocument);
    EXPECT_EQ(mediaKindFromString("hologram"), MediaKind::kUnknown);
    EXPECT_EQ(toString(MediaKind::kAudio), "audio");
    EXPECT_TRUE(isMediaKind(MediaKind::kAudio));
    EXPECT_FALSE(isMediaKind(MediaKind::kImage));
  }

}  // namespace ferry::content
