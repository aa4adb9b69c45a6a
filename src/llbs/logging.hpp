//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -
//
#pragma once
#ifndef LLBS_LOGGING_HPP
#define LLBS_LOGGING_HPP

#include <llbs/config.hpp>

#include <ostream>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(LLBS_DISABLE_LOGGING)

// Nothing to include!

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LLBS_USE_GLOG)

#include <glog/logging.h>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LLBS_USE_SELF_LOGGING)

#include <atomic>
#include <chrono>
#include <iostream>

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#else

#error No Logging Impl Selected!

#endif

//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++

namespace llbs {

namespace detail {
struct NullStream {
  template <typename Arg>
  const NullStream& operator<<(Arg&&) const noexcept
  {
    return *this;
  }

  const NullStream& operator<<(std::ostream& (*)(std::ostream&)) const noexcept
  {
    return *this;
  }
};
}  // namespace detail

#define LLBS_LOG_NO_OUTPUT()                                                                       \
  if (false)                                                                                       \
  (::llbs::detail::NullStream{})

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#if defined(LLBS_DISABLE_LOGGING)

#define LLBS_LOG_ERROR() LLBS_LOG_NO_OUTPUT()
#define LLBS_LOG_WARNING() LLBS_LOG_NO_OUTPUT()
#define LLBS_LOG_INFO() LLBS_LOG_NO_OUTPUT()
#define LLBS_VLOG(verbosity) LLBS_LOG_NO_OUTPUT()
#define LLBS_LOG_WARNING_IF(condition) LLBS_LOG_NO_OUTPUT()

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LLBS_USE_GLOG)

#define LLBS_LOG_ERROR() LOG(ERROR)
#define LLBS_LOG_WARNING() LOG(WARNING)
#define LLBS_LOG_INFO() LOG(INFO)
#define LLBS_VLOG(verbosity) VLOG((verbosity))
#define LLBS_LOG_WARNING_IF(condition) LOG_IF(WARNING, (condition))

//=#=#==#==#===============+=+=+=+=++=++++++++++++++-++-+--+-+----+---------------
#elif defined(LLBS_USE_SELF_LOGGING)

inline std::atomic<int> LogSeverityFilter{2};

#define LLBS_LOG_OUTPUT(level_name)                                                                \
  for (bool LlBs_LoG_LooP_FLaG = true; LlBs_LoG_LooP_FLaG;                                         \
       LlBs_LoG_LooP_FLaG = false, std::cerr << std::endl)                                         \
  std::cerr << "["                                                                                 \
            << (std::chrono::duration_cast<std::chrono::microseconds>(                             \
                    std::chrono::steady_clock::now().time_since_epoch())                           \
                    .count())                                                                      \
            << "] " << (level_name) << " "

#define LLBS_LOG_SEVERITY(level, level_name)                                                       \
  if (::llbs::LogSeverityFilter >= (level))                                                        \
  LLBS_LOG_OUTPUT((level_name))

#define LLBS_LOG_ERROR() LLBS_LOG_SEVERITY(0, "ERROR")
#define LLBS_LOG_WARNING() LLBS_LOG_SEVERITY(1, "WARNING")
#define LLBS_LOG_INFO() LLBS_LOG_SEVERITY(2, "INFO")
#define LLBS_VLOG(verbosity) LLBS_LOG_SEVERITY(2 + (verbosity), "INFO")

#define LLBS_LOG_WARNING_IF(condition)                                                             \
  if (condition)                                                                                   \
  LLBS_LOG_WARNING()

#endif

//+++++++++++-+-+--+----- --- -- -  -  -   -

// Same as LLBS_LOG_WARNING(), but silent while a unit test has requested suppression of expected
// failures (see suppress_log_output_for_test()).
//
#define LLBS_LOG_WARNING_UNLESS_SUPPRESSED()                                                       \
  LLBS_LOG_WARNING_IF(!::llbs::suppress_log_output_for_test().load())

}  // namespace llbs

#endif  // LLBS_LOGGING_HPP
