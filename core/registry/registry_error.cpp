/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/registry_error.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(ferry::registry, RegistryError, e) {
  using E = ferry::registry::RegistryError;
  switch (e) {
    case E::kConflict:
      return "RegistryError: session already registered";
    case E::kNotFound:
      return "RegistryError: session not found";
    case E::kNoAttemptInFlight:
      return "RegistryError: session has no attempt in flight";
  }
  return "RegistryError: unknown error";
}
