//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_OPTIONAL_HPP
#define LLBS_OPTIONAL_HPP

#include <batteries/optional.hpp>

namespace llbs {

using ::batt::make_optional;
using ::batt::None;
using ::batt::Optional;

}  // namespace llbs

#endif  // LLBS_OPTIONAL_HPP
