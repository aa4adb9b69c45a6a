//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#pragma once
#ifndef LLBS_STATUS_CODE_HPP
#define LLBS_STATUS_CODE_HPP

#include <batteries/status.hpp>

namespace llbs {

// The closed set of error codes shared by all LLBS components.  Only a few of these are produced by
// the block layers themselves (kBufferTooSmall, kNoSuchBlock, kNotImplemented); the rest are
// reserved for devices and higher layers built on top of this library.
//
enum struct StatusCode {
  kOk = 0,
  kInvalidOffset = 1,
  kBufferTooSmall = 2,
  kPrematureEndOfInput = 3,
  kNoSuchBlock = 4,
  kNotImplemented = 5,
  kNotFound = 6,
  kExistsButShouldNot = 7,
  kBadAddress = 8,
  kDecodeError = 9,
  kInvalidMagicNumber = 10,
  kIncoherentData = 11,
  kInvalidArgument = 12,
  kIsFile = 13,
  kIsDir = 14,
  kWriteError = 15,
};

bool initialize_status_codes();

::batt::Status make_status(StatusCode code);

}  // namespace llbs

#endif  // LLBS_STATUS_CODE_HPP
