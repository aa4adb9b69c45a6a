//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_TESTING_MEMORY_BLOCK_DEVICE_HPP
#define LLBS_TESTING_MEMORY_BLOCK_DEVICE_HPP

#include <llbs/config.hpp>
//
#include <llbs/block_device.hpp>

#include <atomic>
#include <vector>

namespace llbs {
namespace testing {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief A RAM-backed BlockDevice; all blocks start out zero-filled.
 *
 * Not thread-safe on its own: callers must serialize writes with other accesses (the BlockCache and
 * CowBlockDevice layers do this for the devices they own).
 */
class MemoryBlockDevice : public BlockDevice
{
 public:
  explicit MemoryBlockDevice(usize block_size, usize block_count) noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize block_size() const override;

  usize block_count() const override;

  StatusOr<usize> read_block(u64 block, const MutableBuffer& buffer) const override;

  StatusOr<usize> write_block(u64 block, const ConstBuffer& buffer) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns the raw contents of `block` for inspection by tests.
   */
  ConstBuffer peek(u64 block) const;

  /** \brief Fills every byte of `block` with `value`, bypassing the BlockDevice interface (and the
   * counters below).
   */
  void fill(u64 block, u8 value);

  mutable std::atomic<usize> read_block_count{0};
  std::atomic<usize> write_block_count{0};

 private:
  Status validate_address(u64 block) const;

  const usize block_size_;
  const usize block_count_;
  std::vector<u8> storage_;
};

}  // namespace testing
}  // namespace llbs

#endif  // LLBS_TESTING_MEMORY_BLOCK_DEVICE_HPP
