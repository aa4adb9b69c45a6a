//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_BLOCK_DEVICE_HPP
#define LLBS_BLOCK_DEVICE_HPP

#include <llbs/buffer.hpp>
#include <llbs/int_types.hpp>
#include <llbs/status.hpp>

#include <functional>
#include <ostream>

namespace llbs {

// Abstracts random-access storage made up of `block_count()` fixed-size blocks, each
// `block_size()` bytes long, addressed by block index.
//
class BlockDevice
{
 public:
  // For the convenience of implementations; returns OkStatus() if a buffer of `buffer_size` bytes
  // can hold one block of `block_size` bytes, StatusCode::kBufferTooSmall otherwise.
  //
  static Status validate_buffer_size(usize buffer_size, usize block_size);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  BlockDevice(const BlockDevice&) = delete;
  BlockDevice& operator=(const BlockDevice&) = delete;

  virtual ~BlockDevice() = default;

  // The size in bytes of every block on this device.
  //
  virtual usize block_size() const = 0;

  // The number of addressable blocks; valid addresses are [0, block_count()).
  //
  virtual usize block_count() const = 0;

  // Fill the first `block_size()` bytes of `buffer` with the contents of `block`.  Returns the
  // number of bytes read (always `block_size()`) on success.
  //
  // Fails with StatusCode::kBufferTooSmall if `buffer.size() < block_size()`; the error for an
  // invalid `block` is implementation-defined.
  //
  virtual StatusOr<usize> read_block(u64 block, const MutableBuffer& buffer) const = 0;

  // Replace the contents of `block` with the first `block_size()` bytes of `buffer`.  Returns the
  // number of bytes written (always `block_size()`) on success.
  //
  // Same error contract as `read_block`.
  //
  virtual StatusOr<usize> write_block(u64 block, const ConstBuffer& buffer) = 0;

  // For convenience...
  //
  usize byte_size() const
  {
    return this->block_size() * this->block_count();
  }

  // Prints block size and count.
  //
  std::function<void(std::ostream&)> summary() const;

 protected:
  BlockDevice() = default;
};

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

// Reads `buffer.size()` bytes from `device` starting at byte `offset`, which need not be aligned to
// a block boundary.  The request is translated into one `read_block` call per block touched.
//
// Returns `buffer.size()` on success.  If any block read fails, the whole operation fails with that
// error and the contents of `buffer` are unspecified.
//
StatusOr<usize> read_at(const BlockDevice& device, u64 offset, const MutableBuffer& buffer);

// Byte-addressed counterpart to `read_at`.  Not supported at this layer: always fails with
// StatusCode::kNotImplemented.
//
StatusOr<usize> write_at(BlockDevice& device, u64 offset, const ConstBuffer& data);

}  // namespace llbs

#endif  // LLBS_BLOCK_DEVICE_HPP
