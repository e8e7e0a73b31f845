/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include "common/outcome.hpp"

namespace ferry::registry {

  enum class RegistryError {
    kConflict = 1,
    kNotFound,
    kNoAttemptInFlight,
  };

}  // namespace ferry::registry

OUTCOME_HPP_DECLARE_ERROR(ferry::registry, RegistryError);
