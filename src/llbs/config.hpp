//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_CONFIG_HPP
#define LLBS_CONFIG_HPP

#include <llbs/int_types.hpp>

#include <atomic>

namespace llbs {

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------

// A conventional block (sector) size.
//
constexpr usize kDefaultBlockSize = 512;

// The default number of blocks held by a BlockCache.
//
constexpr usize kDefaultBlockCacheCapacity = 64;

// Name of the environment variable that overrides kDefaultBlockCacheCapacity in
// BlockCacheOptions::with_default_values().
//
constexpr const char* kBlockCacheCapacityEnvVar = "LLBS_BLOCK_CACHE_CAPACITY";

// ** FOR TESTING ONLY **
//
// Suppress ERROR/WARNING level output for expected errors while running unit tests.
//
inline std::atomic<bool>& suppress_log_output_for_test()
{
  static std::atomic<bool> value_{false};
  return value_;
}

// Logging configuration; uncomment one of the lines below to select the logging implementation.
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//#define LLBS_DISABLE_LOGGING
#define LLBS_USE_GLOG
//#define LLBS_USE_SELF_LOGGING
//+++++++++++-+-+--+----- --- -- -  -  -   -

}  // namespace llbs

#endif  // LLBS_CONFIG_HPP
