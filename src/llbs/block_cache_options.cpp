//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <llbs/block_cache_options.hpp>
//
#include <llbs/logging.hpp>
#include <llbs/optional.hpp>

#include <batteries/assert.hpp>
#include <batteries/env.hpp>

namespace llbs {

namespace {

usize default_capacity_from_env()
{
  static const usize capacity_ = [] {
    Optional<usize> value = batt::getenv_as<usize>(kBlockCacheCapacityEnvVar);
    if (!value || *value == 0) {
      return kDefaultBlockCacheCapacity;
    }
    LLBS_LOG_INFO() << kBlockCacheCapacityEnvVar << "=" << *value;
    return *value;
  }();

  return capacity_;
}

}  // namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BlockCacheOptions BlockCacheOptions::with_default_values()
{
  BlockCacheOptions opts;

  opts.set_capacity(default_capacity_from_env());
  opts.set_name("default");

  return opts;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BlockCacheOptions& BlockCacheOptions::set_capacity(usize n_blocks)
{
  BATT_CHECK_GT(n_blocks, 0u);

  this->capacity = n_blocks;
  return *this;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
BlockCacheOptions& BlockCacheOptions::set_name(std::string_view name)
{
  this->name = std::string{name};
  return *this;
}

}  // namespace llbs
