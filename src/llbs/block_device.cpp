//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <llbs/block_device.hpp>
//

#include <llbs/logging.hpp>
#include <llbs/status_code.hpp>

#include <batteries/assert.hpp>
#include <batteries/hint.hpp>

#include <vector>

namespace llbs {

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
/*static*/ Status BlockDevice::validate_buffer_size(usize buffer_size, usize block_size)
{
  if (BATT_HINT_TRUE(buffer_size >= block_size)) {
    return OkStatus();
  }
  return make_status(StatusCode::kBufferTooSmall);
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
std::function<void(std::ostream&)> BlockDevice::summary() const
{
  return [this](std::ostream& out) {
    out << "BlockDevice{.block_size=" << this->block_size()
        << ", .block_count=" << this->block_count() << ",}";
  };
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> read_at(const BlockDevice& device, u64 offset, const MutableBuffer& buffer)
{
  const usize len = buffer.size();
  if (len == 0) {
    return {usize{0}};
  }

  const usize block_size = device.block_size();
  BATT_CHECK_NE(block_size, 0u);

  const u64 start_block = offset / block_size;
  const u64 end_block = (offset + len) / block_size;
  const usize relative_offset = offset % block_size;

  // If we read exactly one aligned block, let the device write directly into the caller's buffer.
  //
  if (relative_offset == 0 && len == block_size) {
    return device.read_block(start_block, buffer);
  }

  // Only a range that both starts and ends on block boundaries can skip the block at `end_block`.
  // An unaligned start always stages one block past `end_block - 1`, even when the range ends on a
  // boundary, so such a read can fail on the last block of the device.
  //
  const bool ends_on_boundary = ((offset + len) % block_size) == 0;
  const usize n_blocks = (relative_offset == 0 && ends_on_boundary && start_block != end_block)
                             ? (end_block - start_block)
                             : (end_block - start_block + 1);

  LLBS_VLOG(2) << "read_at(offset=" << offset << ", len=" << len << ")" << BATT_INSPECT(start_block)
               << BATT_INSPECT(n_blocks) << BATT_INSPECT(relative_offset);

  std::vector<u8> staging(n_blocks * block_size);
  for (usize i = 0; i < n_blocks; ++i) {
    BATT_REQUIRE_OK(device.read_block(start_block + i,
                                      MutableBuffer{staging.data() + i * block_size, block_size}));
  }

  BATT_CHECK_LE(relative_offset + len, staging.size());

  copy_bytes(buffer, ConstBuffer{staging.data() + relative_offset, len});

  return {len};
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
StatusOr<usize> write_at(BlockDevice& /*device*/, u64 /*offset*/, const ConstBuffer& /*data*/)
{
  return make_status(StatusCode::kNotImplemented);
}

}  // namespace llbs
