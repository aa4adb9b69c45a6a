//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_LRU_CACHE_HPP
#define LLBS_LRU_CACHE_HPP

#include <llbs/config.hpp>
//
#include <llbs/int_types.hpp>

#include <batteries/assert.hpp>

#include <functional>
#include <list>
#include <utility>

namespace llbs {

/** \brief A bounded container that keeps its values in most-recently-used order.
 *
 * The front of the container (position 0) is the most recently used value; the back is the least
 * recently used, and is the one evicted when a new value is inserted into a full cache.  Every value
 * that leaves the cache (by overflow or because the cache itself is destroyed) is passed exactly
 * once to the eviction handler.
 *
 * LruCache does not de-duplicate; if the caller inserts two values it considers equivalent, both
 * are kept.  It is also not thread-safe; callers must provide their own locking.
 */
template <typename V>
class LruCache
{
 public:
  using EvictHandler = std::function<void(V&&)>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Creates an empty cache whose evicted values are simply released.
   */
  explicit LruCache(usize max_size) noexcept : LruCache{max_size, [](V&&) {}}
  {
  }

  /** \brief Creates an empty cache that passes every evicted value to `on_evict`.
   */
  explicit LruCache(usize max_size, EvictHandler&& on_evict) noexcept
      : max_size_{max_size}
      , on_evict_{std::move(on_evict)}
  {
    BATT_CHECK_GT(this->max_size_, 0u);
    BATT_CHECK(this->on_evict_);
  }

  LruCache(const LruCache&) = delete;
  LruCache& operator=(const LruCache&) = delete;

  /** \brief Evicts all remaining values, least recently used first.
   */
  ~LruCache() noexcept
  {
    while (!this->data_.empty()) {
      this->evict_back();
    }
  }

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns a pointer to the first value (in MRU order) for which `predicate` returns true,
   * after moving it to the front; returns nullptr and leaves the order unchanged if there is no
   * such value.
   *
   * The returned pointer is valid until the next call to `insert` or the destruction of the cache.
   */
  template <typename Predicate>
  V* find(Predicate&& predicate)
  {
    for (auto iter = this->data_.begin(); iter != this->data_.end(); ++iter) {
      if (predicate(static_cast<const V&>(*iter))) {
        this->data_.splice(this->data_.begin(), this->data_, iter);
        return &this->data_.front();
      }
    }
    return nullptr;
  }

  /** \brief Inserts `item` at the front of the cache.  If the cache is full, the least recently used
   * value is evicted first.
   */
  void insert(V&& item)
  {
    if (this->data_.size() >= this->max_size_) {
      this->evict_back();
    }
    this->data_.push_front(std::move(item));
  }

  void insert(const V& item)
  {
    this->insert(V{item});
  }

  /** \brief Invokes `fn` on each value, from most to least recently used, without changing the
   * order.
   */
  template <typename Fn>
  void for_each(Fn&& fn) const
  {
    for (const V& value : this->data_) {
      fn(value);
    }
  }

  usize size() const noexcept
  {
    return this->data_.size();
  }

  bool empty() const noexcept
  {
    return this->data_.empty();
  }

  usize max_size() const noexcept
  {
    return this->max_size_;
  }

 private:
  void evict_back()
  {
    V value = std::move(this->data_.back());
    this->data_.pop_back();
    this->on_evict_(std::move(value));
  }

  const usize max_size_;
  EvictHandler on_evict_;
  std::list<V> data_;
};

}  // namespace llbs

#endif  // LLBS_LRU_CACHE_HPP
