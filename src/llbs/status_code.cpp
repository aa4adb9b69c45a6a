//#=##=##=#==#=#==#===#+==#+==========+==+=+=+=+=+=++=+++=+++++=-++++=-+++++++++++
//
// Part of the LLBS Project, under Apache License v2.0.
// See https://www.apache.org/licenses/LICENSE-2.0 for license information.
// SPDX short identifier: Apache-2.0
//
//+++++++++++-+-+--+----- --- -- -  -  -   -

#include <llbs/status_code.hpp>
//

#include <batteries/status.hpp>

namespace llbs {

#define CODE_WITH_MSG_(code, msg)                                                                  \
  {                                                                                                \
    code, msg " (" #code ")"                                                                       \
  }

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
bool initialize_status_codes()
{
  static bool const initialized = batt::Status::register_codes<StatusCode>({
      CODE_WITH_MSG_(StatusCode::kOk, "Ok"),  // 0
      CODE_WITH_MSG_(StatusCode::kInvalidOffset,
                     "The offset is out of bounds or does not meet other restrictions"),  // 1
      CODE_WITH_MSG_(StatusCode::kBufferTooSmall,
                     "The provided buffer is smaller than the device block size"),  // 2
      CODE_WITH_MSG_(StatusCode::kPrematureEndOfInput,
                     "The input ended although more data was expected"),  // 3
      CODE_WITH_MSG_(StatusCode::kNoSuchBlock,
                     "The requested block is not present on the device"),  // 4
      CODE_WITH_MSG_(StatusCode::kNotImplemented,
                     "The requested operation is not implemented by this component"),  // 5
      CODE_WITH_MSG_(StatusCode::kNotFound, "The requested entity was not found"),     // 6
      CODE_WITH_MSG_(StatusCode::kExistsButShouldNot,
                     "An entry was found, but there must not be one"),             // 7
      CODE_WITH_MSG_(StatusCode::kBadAddress, "The provided address is invalid"),  // 8
      CODE_WITH_MSG_(StatusCode::kDecodeError,
                     "An invalid value was encountered while decoding"),  // 9
      CODE_WITH_MSG_(StatusCode::kInvalidMagicNumber,
                     "Bad magic number - Possible data corruption"),  // 10
      CODE_WITH_MSG_(StatusCode::kIncoherentData,
                     "The data is not coherent or a checksum did not match"),        // 11
      CODE_WITH_MSG_(StatusCode::kInvalidArgument, "The provided argument is invalid"),  // 12
      CODE_WITH_MSG_(StatusCode::kIsFile, "The entry is a file"),                        // 13
      CODE_WITH_MSG_(StatusCode::kIsDir, "The entry is a directory"),                    // 14
      CODE_WITH_MSG_(StatusCode::kWriteError, "The device failed to write the data"),    // 15
  });
  return initialized;
}

//==#==========+==+=+=++=+++++++++++-+-+--+----- --- -- -  -  -   -
//
::batt::Status make_status(StatusCode code)
{
  initialize_status_codes();

  return ::batt::Status{code};
}

}  // namespace llbs
