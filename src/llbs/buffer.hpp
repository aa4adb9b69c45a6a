//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_BUFFER_HPP
#define LLBS_BUFFER_HPP

#include <llbs/int_types.hpp>

#include <batteries/buffer.hpp>

#include <algorithm>
#include <cstring>

namespace llbs {

using batt::ConstBuffer;
using batt::MutableBuffer;

// Copies min(dst.size(), src.size()) bytes from `src` to `dst`; returns the number of bytes copied.
//
inline usize copy_bytes(const MutableBuffer& dst, const ConstBuffer& src)
{
  const usize n = std::min(dst.size(), src.size());
  if (n != 0) {
    std::memcpy(dst.data(), src.data(), n);
  }
  return n;
}

}  // namespace llbs

#endif  // LLBS_BUFFER_HPP
