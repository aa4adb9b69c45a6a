//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_BLOCK_CACHE_OPTIONS_HPP
#define LLBS_BLOCK_CACHE_OPTIONS_HPP

#include <llbs/config.hpp>
//
#include <llbs/int_types.hpp>

#include <string>
#include <string_view>

namespace llbs {

class BlockCacheOptions
{
 public:
  /** \brief Returns options with the default capacity (kDefaultBlockCacheCapacity, unless
   * overridden by the environment variable named by kBlockCacheCapacityEnvVar) and the name
   * "default".
   */
  static BlockCacheOptions with_default_values();

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  /** \brief Sets the maximum number of blocks the cache holds; must be greater than zero.
   */
  BlockCacheOptions& set_capacity(usize n_blocks);

  /** \brief Sets the name used to label this cache's metrics.
   */
  BlockCacheOptions& set_name(std::string_view name);

  //+++++++++++-+-+--+----- --- -- -  -  -   -

  usize capacity;

  std::string name;
};

}  // namespace llbs

#endif  // LLBS_BLOCK_CACHE_OPTIONS_HPP
