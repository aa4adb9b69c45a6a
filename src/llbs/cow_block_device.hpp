//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_COW_BLOCK_DEVICE_HPP
#define LLBS_COW_BLOCK_DEVICE_HPP

#include <llbs/config.hpp>
//
#include <llbs/block_device.hpp>
#include <llbs/int_types.hpp>
#include <llbs/read_write_locked.hpp>
#include <llbs/status.hpp>

#include <batteries/async/mutex.hpp>

#include <map>
#include <memory>
#include <type_traits>
#include <vector>

namespace llbs {

/** \brief A copy-on-write BlockDevice: all writes go to a private in-memory overlay, and the wrapped
 * (backing) device is never modified.
 *
 * The first write to an address "materializes" it: the block is read from the backing device into
 * the overlay, then overwritten with the caller's data.  Each address is read from the backing
 * device at most once, even with concurrent writers.
 *
 * Reads are served from the overlay only.  Reading an address that has not been written through
 * this device fails with StatusCode::kNoSuchBlock, even if the backing device has data there; reads
 * never materialize a block.
 *
 * The overlay lives in memory and is discarded along with the CowBlockDevice.
 *
 * All public member functions are thread-safe.
 */
template <typename D>
class CowBlockDevice : public BlockDevice
{
 public:
  static_assert(std::is_base_of_v<BlockDevice, D>,
                "CowBlockDevice<D> requires D to be a BlockDevice");

  using Device = D;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Takes ownership of `device` (must not be null), which becomes the backing device.
   */
  explicit CowBlockDevice(std::unique_ptr<D> device) noexcept;

  ~CowBlockDevice() noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -
  // BlockDevice interface.

  usize block_size() const override;

  usize block_count() const override;

  StatusOr<usize> read_block(u64 block, const MutableBuffer& buffer) const override;

  StatusOr<usize> write_block(u64 block, const ConstBuffer& buffer) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns true iff `block` has been written through this device.
   */
  bool is_materialized(u64 block) const;

  /** \brief The number of blocks in the overlay.
   */
  usize materialized_count() const;

 private:
  using BlockRef = std::shared_ptr<ReadWriteLocked<std::vector<u8>>>;

  // Returns the overlay entry for `block`, reading it from the backing device first if it isn't
  // there yet.  On failure the overlay is left unchanged.
  //
  StatusOr<BlockRef> materialize(u64 block);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  ReadWriteLocked<std::unique_ptr<D>> device_;

  mutable batt::Mutex<std::map<u64, BlockRef>> overlay_;
};

}  // namespace llbs

#include <llbs/cow_block_device.ipp>

#endif  // LLBS_COW_BLOCK_DEVICE_HPP
