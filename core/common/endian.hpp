/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <boost/endian.hpp>
#include "common/bytes.hpp"

namespace ferry::common {
  inline void putUint32BigEndian(Bytes &l, uint32_t n) {
    l.resize(l.size() + sizeof(n));
    boost::endian::store_big_u32(&(*(l.end() - sizeof(n))), n);
  }

  inline void putUint64BigEndian(Bytes &l, uint64_t n) {
    l.resize(l.size() + sizeof(n));
    boost::endian::store_big_u64(&(*(l.end() - sizeof(n))), n);
  }

  inline uint32_t getUint32BigEndian(BytesIn in) {
    return boost::endian::load_big_u32(in.data());
  }

  inline uint64_t getUint64BigEndian(BytesIn in) {
    return boost::endian::load_big_u64(in.data());
  }
}  // namespace ferry::common
