//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_COW_BLOCK_DEVICE_IPP
#define LLBS_COW_BLOCK_DEVICE_IPP

#include <llbs/config.hpp>
//
#include <llbs/logging.hpp>
#include <llbs/status_code.hpp>

#include <batteries/assert.hpp>
#include <batteries/stream_util.hpp>

namespace llbs {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline /*explicit*/ CowBlockDevice<D>::CowBlockDevice(std::unique_ptr<D> device) noexcept
    : device_{std::move(device)}
{
  BATT_CHECK_NOT_NULLPTR(this->device_.lock_shared()->get());

  initialize_status_codes();

  LLBS_VLOG(1) << "CowBlockDevice(backing=" << (*this->device_.lock_shared())->summary() << ")";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline CowBlockDevice<D>::~CowBlockDevice() noexcept
{
  LLBS_VLOG(1) << "CowBlockDevice::~CowBlockDevice() discarding " << this->overlay_.lock()->size()
               << " materialized block(s)";
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline usize CowBlockDevice<D>::block_size() const /*override*/
{
  return (*this->device_.lock_shared())->block_size();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline usize CowBlockDevice<D>::block_count() const /*override*/
{
  return (*this->device_.lock_shared())->block_count();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline StatusOr<usize> CowBlockDevice<D>::read_block(u64 block,
                                                     const MutableBuffer& buffer) const /*override*/
{
  const usize block_size = this->block_size();

  BATT_REQUIRE_OK(BlockDevice::validate_buffer_size(buffer.size(), block_size));

  BlockRef found;
  {
    auto locked_overlay = this->overlay_.lock();
    auto iter = locked_overlay->find(block);
    if (iter == locked_overlay->end()) {
      return make_status(StatusCode::kNoSuchBlock);
    }
    found = iter->second;
  }

  {
    auto locked_block = found->lock_shared();
    copy_bytes(buffer, ConstBuffer{locked_block->data(), locked_block->size()});
  }

  return {block_size};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline StatusOr<usize> CowBlockDevice<D>::write_block(u64 block,
                                                      const ConstBuffer& buffer) /*override*/
{
  const usize block_size = this->block_size();

  BATT_REQUIRE_OK(BlockDevice::validate_buffer_size(buffer.size(), block_size));

  BATT_ASSIGN_OK_RESULT(BlockRef found, this->materialize(block));

  {
    auto locked_block = found->lock();
    copy_bytes(MutableBuffer{locked_block->data(), locked_block->size()}, buffer);
  }

  return {block_size};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline auto CowBlockDevice<D>::materialize(u64 block) -> StatusOr<BlockRef>
{
  // The overlay stays locked across the backing device read, so that two writers racing on the same
  // new address can't both copy it in.
  //
  auto locked_overlay = this->overlay_.lock();

  auto iter = locked_overlay->find(block);
  if (iter != locked_overlay->end()) {
    return iter->second;
  }

  std::vector<u8> data;
  {
    auto locked_device = this->device_.lock_shared();

    data.resize((*locked_device)->block_size());
    BATT_REQUIRE_OK((*locked_device)->read_block(block, MutableBuffer{data.data(), data.size()}));
  }

  LLBS_VLOG(2) << "CowBlockDevice materialized block " << block;

  auto new_block = std::make_shared<ReadWriteLocked<std::vector<u8>>>(std::move(data));
  locked_overlay->emplace(block, new_block);

  return new_block;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline bool CowBlockDevice<D>::is_materialized(u64 block) const
{
  return this->overlay_.lock()->count(block) != 0;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
template <typename D>
inline usize CowBlockDevice<D>::materialized_count() const
{
  return this->overlay_.lock()->size();
}

}  // namespace llbs

#endif  // LLBS_COW_BLOCK_DEVICE_IPP
