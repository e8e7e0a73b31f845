/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>

namespace ferry {
  /**
   * Identifier of a transfer session, unique per request attempt within the
   * process
   */
  using SessionId = uint64_t;
}  // namespace ferry
