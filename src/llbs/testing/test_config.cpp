//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <llbs/testing/test_config.hpp>
//
#include <llbs/logging.hpp>
#include <llbs/optional.hpp>

#include <batteries/env.hpp>

namespace llbs {
namespace testing {

namespace {

usize get_random_seed_from_env()
{
  static const usize seed = [] {
    const char* varname = "LLBS_TEST_RANDOM_SEED";

    Optional<usize> value = batt::getenv_as<usize>(varname);
    if (!value) {
      LLBS_LOG_INFO() << varname << " not defined; using default value 0";
      return usize{0};
    }
    LLBS_LOG_INFO() << varname << " == " << *value;
    return *value;
  }();

  return seed;
}

}  //namespace

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
TestConfig::TestConfig() noexcept
{
  this->extra_testing_ =                          //
      batt::getenv_as<int>("LLBS_EXTRA_TESTING")  //
          .value_or(0);

  this->random_seed_ = get_random_seed_from_env();
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool TestConfig::extra_testing() const noexcept
{
  return this->extra_testing_;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
usize TestConfig::get_random_seed() const noexcept
{
  return this->random_seed_;
}

}  //namespace testing
}  //namespace llbs
