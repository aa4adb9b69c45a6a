//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_BLOCK_CACHE_IPP
#define LLBS_BLOCK_CACHE_IPP

#include <llbs/config.hpp>
//
#include <llbs/logging.hpp>
#include <llbs/status_code.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>
#include <batteries/utility.hpp>

#include <string_view>

namespace llbs {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline /*explicit*/ BlockCache<D>::BlockCache(std::unique_ptr<D> device,
                                              const BlockCacheOptions& options)
    : name_{options.name}
    , device_{std::make_shared<DeviceHandle>(require_device(std::move(device)))}
    , block_size_{(*this->device_->lock_shared())->block_size()}
    , capacity_{options.capacity}
    , cache_{this->capacity_, [this](CachedBlockRef&& cached_block) {
               this->write_back(std::move(cached_block));
             }}
{
  initialize_status_codes();

  BATT_CHECK_NE(this->block_size_, 0u);

  LLBS_VLOG(1) << "BlockCache(name=" << this->name_ << ", capacity=" << this->capacity_
               << ", block_size=" << this->block_size_ << ")";

  const auto metric_name = [this](std::string_view property) {
    return batt::to_string("BlockCache_", this->name_, "_", property);
  };

#define ADD_METRIC_(n) global_metric_registry().add(metric_name(#n), this->metrics_.n)

  ADD_METRIC_(query_count);
  ADD_METRIC_(hit_count);
  ADD_METRIC_(miss_count);
  ADD_METRIC_(insert_count);
  ADD_METRIC_(evict_count);
  ADD_METRIC_(write_back_count);
  ADD_METRIC_(write_back_error_count);

#undef ADD_METRIC_
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline BlockCache<D>::~BlockCache() noexcept
{
  global_metric_registry()
      .remove(this->metrics_.query_count)
      .remove(this->metrics_.hit_count)
      .remove(this->metrics_.miss_count)
      .remove(this->metrics_.insert_count)
      .remove(this->metrics_.evict_count)
      .remove(this->metrics_.write_back_count)
      .remove(this->metrics_.write_back_error_count);

  LLBS_VLOG(1) << "BlockCache::~BlockCache(name=" << this->name_ << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline usize BlockCache<D>::block_size() const /*override*/
{
  return this->block_size_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline usize BlockCache<D>::block_count() const /*override*/
{
  return (*this->device_->lock_shared())->block_count();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline StatusOr<usize> BlockCache<D>::read_block(u64 block,
                                                 const MutableBuffer& buffer) const /*override*/
{
  BATT_REQUIRE_OK(BlockDevice::validate_buffer_size(buffer.size(), this->block_size_));

  this->metrics_.query_count.fetch_add(1);

  const auto has_address = [block](const CachedBlockRef& cached_block) {
    return cached_block->lock_shared()->address == block;
  };

  CachedBlockRef found;
  {
    auto locked_cache = this->cache_.lock();
    if (CachedBlockRef* p_found = locked_cache->find(has_address)) {
      found = *p_found;
    }
  }

  if (found) {
    this->metrics_.hit_count.fetch_add(1);
  } else {
    this->metrics_.miss_count.fetch_add(1);

    // Read the block from the device without holding the cache lock, so that hits on other blocks
    // are not held up by device I/O.
    //
    std::vector<u8> data(this->block_size_);
    BATT_REQUIRE_OK(
        (*this->device_->lock_shared())->read_block(block, MutableBuffer{data.data(), data.size()}));

    LLBS_VLOG(2) << "BlockCache{" << this->name_ << "} loaded block " << block;

    auto locked_cache = this->cache_.lock();

    // Another thread may have loaded the same block while we were reading it; keep the existing
    // entry so there is never more than one cached copy of an address.
    //
    if (CachedBlockRef* p_found = locked_cache->find(has_address)) {
      found = *p_found;
    } else {
      found = std::make_shared<ReadWriteLocked<CachedBlock>>(
          CachedBlock{this->device_, block, std::move(data)});

      this->metrics_.insert_count.fetch_add(1);
      locked_cache->insert(batt::make_copy(found));
    }
  }

  {
    auto locked_block = found->lock_shared();
    copy_bytes(buffer, ConstBuffer{locked_block->data.data(), locked_block->data.size()});
  }

  return {this->block_size_};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline StatusOr<usize> BlockCache<D>::write_block(u64 block,
                                                  const ConstBuffer& buffer) /*override*/
{
  return (*this->device_->lock())->write_block(block, buffer);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline usize BlockCache<D>::size() const
{
  return this->cache_.lock()->size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline std::vector<u64> BlockCache<D>::cached_addresses() const
{
  std::vector<u64> addresses;
  {
    auto locked_cache = this->cache_.lock();
    addresses.reserve(locked_cache->size());
    locked_cache->for_each([&addresses](const CachedBlockRef& cached_block) {
      addresses.emplace_back(cached_block->lock_shared()->address);
    });
  }
  return addresses;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline /*static*/ std::unique_ptr<D> BlockCache<D>::require_device(std::unique_ptr<D> device)
{
  BATT_CHECK_NOT_NULLPTR(device.get());

  return device;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline void BlockCache<D>::write_back(CachedBlockRef&& cached_block) noexcept
{
  this->metrics_.evict_count.fetch_add(1);

  auto locked_block = cached_block->lock_shared();

  LLBS_VLOG(2) << "BlockCache{" << this->name_ << "} writing back block " << locked_block->address;

  this->metrics_.write_back_count.fetch_add(1);

  StatusOr<usize> result = (*locked_block->device->lock())
                               ->write_block(locked_block->address,
                                             ConstBuffer{locked_block->data.data(),
                                                         locked_block->data.size()});
  if (!result.ok()) {
    this->metrics_.write_back_error_count.fetch_add(1);
  }

  // There is no caller to return the error to; report it and move on.
  //
  LLBS_WARN_IF_NOT_OK(result) << "BlockCache{" << this->name_ << "} write-back of block "
                              << locked_block->address << " failed";
}

}  // namespace llbs

#endif  // LLBS_BLOCK_CACHE_IPP
