//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_STATUS_HPP
#define LLBS_STATUS_HPP

#include <llbs/logging.hpp>
#include <llbs/status_code.hpp>

#include <batteries/hint.hpp>
#include <batteries/optional.hpp>
#include <batteries/status.hpp>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/stringize.hpp>

namespace llbs {

using batt::OkStatus;
using batt::Status;
using batt::StatusOr;

// Evaluates `expr` once; if the result is not ok, logs a warning (unless suppressed for testing)
// and carries on.  Extra context can be streamed after the macro:
//
//   LLBS_WARN_IF_NOT_OK(device.write_block(n, data)) << BATT_INSPECT(n);
//
#define LLBS_WARN_IF_NOT_OK(expr)                                                                  \
  for (auto BOOST_PP_CAT(llbs_TmpStatusResult, __LINE__) = ::batt::make_optional((expr));          \
       BATT_HINT_FALSE(BOOST_PP_CAT(llbs_TmpStatusResult, __LINE__) &&                             \
                       !BOOST_PP_CAT(llbs_TmpStatusResult, __LINE__)->ok());                       \
       BOOST_PP_CAT(llbs_TmpStatusResult, __LINE__) = ::batt::None)                                \
  LLBS_LOG_WARNING_UNLESS_SUPPRESSED()                                                             \
      << "Expected OK result, but got: " << BOOST_PP_STRINGIZE((expr)) << " == "                   \
      << BOOST_PP_CAT(llbs_TmpStatusResult, __LINE__) << "; "

}  // namespace llbs

#endif  // LLBS_STATUS_HPP
