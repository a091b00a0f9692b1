#ifndef TOKENKEEPER_RESOURCE_MEMORY_CACHE_H
#define TOKENKEEPER_RESOURCE_MEMORY_CACHE_H

#include <chrono>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>

#include "tokenkeeper/core/compat.h"
#include "tokenkeeper/event/event_loop.h"

/**
 * @file memory_cache.h
 * @brief Thread-safe LRU cache whose entries expire at absolute deadlines
 */

namespace tokenkeeper {
namespace resource {

/**
 * @brief Thread-safe LRU cache with per-entry deadlines
 *
 * Each entry lives until its own deadline on the injected monotonic clock.
 * When the capacity is reached the least recently used entry is evicted.
 *
 * @tparam Key The key type
 * @tparam Value The value type
 * @tparam Hash The hash function for the key type
 */
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class MemoryCache {
 public:
  /**
   * @param max_size Maximum number of entries, at least one
   * @param time_source Clock deadlines are compared against
   */
  MemoryCache(size_t max_size, const event::TimeSource& time_source)
      : max_size_(max_size == 0 ? 1 : max_size), time_source_(time_source) {}

  /**
   * @brief Insert or replace an entry that is served until `deadline`
   *
   * Entries whose deadline has already passed are not stored.
   */
  void put(const Key& key, const Value& value, event::MonotonicTime deadline) {
    std::lock_guard<std::mutex> lock(mutex_);

    eraseLocked(key);
    if (time_source_.monotonicTime() >= deadline) {
      return;
    }

    lru_list_.push_front(key);
    cache_map_.emplace(key, CacheData{lru_list_.begin(), value, deadline});

    while (cache_map_.size() > max_size_) {
      evictLru();
    }
  }

  /**
   * @brief Value for `key` if present and its deadline has not passed
   */
  optional<Value> get(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return nullopt;
    }

    if (time_source_.monotonicTime() >= it->second.deadline) {
      lru_list_.erase(it->second.list_iterator);
      cache_map_.erase(it);
      return nullopt;
    }

    // Move to front of LRU list
    lru_list_.splice(lru_list_.begin(), lru_list_, it->second.list_iterator);
    it->second.list_iterator = lru_list_.begin();

    return it->second.value;
  }

  bool remove(const Key& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return eraseLocked(key);
  }

  void clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_map_.clear();
    lru_list_.clear();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_map_.size();
  }

  size_t capacity() const { return max_size_; }

  /**
   * @brief Drop every entry whose deadline has passed
   * @return Number of entries removed
   */
  size_t evictExpired() {
    std::lock_guard<std::mutex> lock(mutex_);

    const auto now = time_source_.monotonicTime();
    size_t evicted = 0;

    auto it = cache_map_.begin();
    while (it != cache_map_.end()) {
      if (now >= it->second.deadline) {
        lru_list_.erase(it->second.list_iterator);
        it = cache_map_.erase(it);
        ++evicted;
      } else {
        ++it;
      }
    }

    return evicted;
  }

 private:
  struct CacheData {
    typename std::list<Key>::iterator list_iterator;
    Value value;
    event::MonotonicTime deadline;
  };

  bool eraseLocked(const Key& key) {
    auto it = cache_map_.find(key);
    if (it == cache_map_.end()) {
      return false;
    }
    lru_list_.erase(it->second.list_iterator);
    cache_map_.erase(it);
    return true;
  }

  void evictLru() {
    if (!lru_list_.empty()) {
      auto key = lru_list_.back();
      lru_list_.pop_back();
      cache_map_.erase(key);
    }
  }

  mutable std::mutex mutex_;
  const size_t max_size_;
  const event::TimeSource& time_source_;
  // Front = most recently used, Back = least recently used
  std::list<Key> lru_list_;
  std::unordered_map<Key, CacheData, Hash> cache_map_;
};

}  // namespace resource
}  // namespace tokenkeeper

#endif  // TOKENKEEPER_RESOURCE_MEMORY_CACHE_H
