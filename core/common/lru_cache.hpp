/**
 * Copyright Soramitsu Co., Ltd. All Rights Reserved.
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef CPP_FERRY_CORE_COMMON_LRU_CACHE_HPP
#define CPP_FERRY_CORE_COMMON_LRU_CACHE_HPP

#include <cassert>
#include <functional>
#include <list>
#include <memory>
#include <unordered_map>

namespace ferry::common {

  /**
   * Bounded key-value cache, least recently used entry is evicted first
   */
  template <typename Key, typename Value>
  class LRUCache {
   public:
    using ExtractKey = std::function<Key(const Value &)>;

    LRUCache(size_t size_limit, ExtractKey extract_key_fn)
        : size_limit_(size_limit), extract_key_(std::move(extract_key_fn)) {
      assert(size_limit_ >= 1);
      assert(extract_key_);
    }

    std::shared_ptr<const Value> get(const Key &key) {
      auto it = map_.find(key);
      if (it == map_.end()) {
        return std::shared_ptr<const Value>{};
      }
      items_.splice(items_.begin(), items_, it->second);
      return *it->second;
    }

    void put(std::shared_ptr<Value> value) {
      assert(value);
      auto key = extract_key_(*value);
      auto it = map_.find(key);
      if (it != map_.end()) {
        *it->second = std::move(value);
        items_.splice(items_.begin(), items_, it->second);
        return;
      }
      if (items_.size() >= size_limit_) {
        map_.erase(extract_key_(*items_.back()));
        items_.pop_back();
      }
      items_.push_front(std::move(value));
      map_.emplace(std::move(key), items_.begin());
    }

    size_t size() const {
      return items_.size();
    }

   private:
    using List = std::list<std::shared_ptr<Value>>;

    const size_t size_limit_;
    ExtractKey extract_key_;
    List items_;
    std::unordered_map<Key, typename List::iterator> map_;
  };

}  // namespace ferry::common

#endif  // CPP_FERRY_CORE_COMMON_LRU_CACHE_HPP
