/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <cstdint>
#include <gsl/span>
#include <string>
#include <vector>

#include <boost/algorithm/hex.hpp>

namespace ferry {
  using Bytes = std::vector<uint8_t>;
  using BytesIn = gsl::span<const uint8_t>;
  using BytesOut = gsl::span<uint8_t>;

  inline Bytes copy(BytesIn r) {
    return {r.begin(), r.end()};
  }

  inline void append(Bytes &l, BytesIn r) {
    l.insert(l.end(), r.begin(), r.end());
  }

  /// Lowercase hex representation
  inline std::string toHex(BytesIn bytes) {
    std::string hex;
    hex.reserve(bytes.size() * 2);
    boost::algorithm::hex_lower(
        bytes.begin(), bytes.end(), std::back_inserter(hex));
    return hex;
  }
}  // namespace ferry
