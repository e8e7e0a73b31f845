/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "content/content_store.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ferry::content, ContentStoreError, e) {
  using ferry::content::ContentStoreError;
  if (e == ContentStoreError::kNotFound) {
    return "Content not found";
  }
  return "Unknown content store error";
}
