//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_TESTING_COUNTING_BLOCK_DEVICE_HPP
#define LLBS_TESTING_COUNTING_BLOCK_DEVICE_HPP

#include <llbs/config.hpp>
//
#include <llbs/block_device.hpp>

#include <batteries/async/mutex.hpp>

#include <atomic>
#include <vector>

namespace llbs {
namespace testing {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
//
/** \brief A BlockDevice whose blocks all read back as `fill_value`, and which counts every call made
 * through the BlockDevice interface.
 *
 * Writes are accepted (and recorded in `written_blocks`) but do not change what is read.
 */
class CountingBlockDevice : public BlockDevice
{
 public:
  static constexpr u8 kDefaultFillValue = 1;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  explicit CountingBlockDevice(usize block_size, usize block_count,
                               u8 fill_value = kDefaultFillValue) noexcept;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize block_size() const override;

  usize block_count() const override;

  StatusOr<usize> read_block(u64 block, const MutableBuffer& buffer) const override;

  StatusOr<usize> write_block(u64 block, const ConstBuffer& buffer) override;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Returns the addresses passed to `write_block`, in call order.
   */
  std::vector<u64> written_blocks() const;

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  mutable std::atomic<usize> block_size_count{0};
  mutable std::atomic<usize> block_count_count{0};
  mutable std::atomic<usize> read_block_count{0};
  std::atomic<usize> write_block_count{0};

 private:
  const usize block_size_;
  const usize block_count_;
  const u8 fill_value_;

  mutable batt::Mutex<std::vector<u64>> written_blocks_;
};

}  // namespace testing
}  // namespace llbs

#endif  // LLBS_TESTING_COUNTING_BLOCK_DEVICE_HPP
