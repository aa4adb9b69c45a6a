//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_BLOCK_CACHE_HPP
#define LLBS_BLOCK_CACHE_HPP

#include <llbs/config.hpp>
//
#include <llbs/block_cache_options.hpp>
#include <llbs/block_device.hpp>
#include <llbs/int_types.hpp>
#include <llbs/lru_cache.hpp>
#include <llbs/metrics.hpp>
#include <llbs/read_write_locked.hpp>
#include <llbs/status.hpp>

#include <batteries/async/mutex.hpp>

#include <memory>
#include <string>
#include <type_traits>
#include <vector>

namespace llbs {

/** \brief A BlockDevice that keeps the most recently read blocks of another BlockDevice in memory.
 *
 * Reads are served from the cache when possible; on a miss the block is read from the wrapped
 * device and inserted, possibly evicting the least recently used block.  Every block that leaves
 * the cache (by eviction or when the BlockCache is destroyed) is written back to the device exactly
 * once.  Errors from these write-backs have no caller to report to; they are logged and counted
 * (Metrics::write_back_error_count), then dropped.
 *
 * `write_block` goes straight to the device and does NOT update or invalidate a cached copy of the
 * same block.  A block that was cached before such a write will keep returning (and eventually
 * write back) its old contents; callers that mix reads and writes of the same block through a
 * BlockCache must not rely on coherence.
 *
 * All public member functions are thread-safe.
 */
template <typename D>
class BlockCache : public BlockDevice
{
 public:
  static_assert(std::is_base_of_v<BlockDevice, D>, "BlockCache<D> requires D to be a BlockDevice");

  using Device = D;

  struct Metrics {
    CountMetric<u64> query_count{0};
    CountMetric<u64> hit_count{0};
    CountMetric<u64> miss_count{0};
    CountMetric<u64> insert_count{0};
    CountMetric<u64> evict_count{0};
    CountMetric<u64> write_back_count{0};
    CountMetric<u64> write_back_error_count{0};
  };

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Takes ownership of `device` (must not be null) and wraps it in a cache of
   * `options.capacity` blocks.
   *
   * The device's block size is read once, here; it is assumed not to change afterwards.
   */
  explicit BlockCache(std::unique_ptr<D> device,
                      const BlockCacheOptions& options = BlockCacheOptions::with_default_values());

  /** \brief Writes back and releases all cached blocks.
   */
  ~BlockCache() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // BlockDevice interface.

  usize block_size() const override;

  usize block_count() const override;

  StatusOr<usize> read_block(u64 block, const MutableBuffer& buffer) const override;

  StatusOr<usize> write_block(u64 block, const ConstBuffer& buffer) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief The number of blocks currently cached.
   */
  usize size() const;

  /** \brief The maximum number of blocks held at any time.
   */
  usize capacity() const noexcept
  {
    return this->capacity_;
  }

  /** \brief Returns the addresses of all cached blocks, most recently used first.
   */
  std::vector<u64> cached_addresses() const;

  const Metrics& metrics() const noexcept
  {
    return this->metrics_;
  }

 private:
  using DeviceHandle = ReadWriteLocked<std::unique_ptr<D>>;

  // A cached copy of one block.  Holds a reference to the device so it can be written back.
  //
  struct CachedBlock {
    std::shared_ptr<DeviceHandle> device;
    u64 address;
    std::vector<u8> data;
  };

  using CachedBlockRef = std::shared_ptr<ReadWriteLocked<CachedBlock>>;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  // Returns `device`, which must not be null.
  //
  static std::unique_ptr<D> require_device(std::unique_ptr<D> device);

  // Eviction handler for `cache_`.
  //
  void write_back(CachedBlockRef&& cached_block) noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  const std::string name_;

  mutable Metrics metrics_;

  std::shared_ptr<DeviceHandle> device_;

  const usize block_size_;

  const usize capacity_;

  // Must be declared after everything `write_back` touches, so that the final evictions on
  // destruction see live members.
  //
  mutable batt::Mutex<LruCache<CachedBlockRef>> cache_;
};

}  // namespace llbs

#include <llbs/block_cache.ipp>

#endif  // LLBS_BLOCK_CACHE_HPP
