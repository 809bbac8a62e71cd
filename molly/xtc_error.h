/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - error reporting
 */

#ifndef MOLLY_XTC_ERROR_H
#define MOLLY_XTC_ERROR_H

#include <stdexcept>
#include <string>

namespace molly {

enum class ErrorCode {
  FileNotFound,
  WrongMagicNumber,
  EmptyOrInvalidTrajectory,
  TruncatedInput,
  CorruptFrame,
  EndOfTrajectory,
  ShapeMismatch,
  OutOfRangeSelection,
  InvalidSelection,
  ReaderClosed,
  IoError
};

// Stable name of an error code, e.g. "CorruptFrame"
const char *error_name(ErrorCode code);

class XTCError : public std::runtime_error {
public:
  XTCError(ErrorCode code, const std::string &msg);

  ErrorCode code() const noexcept { return ecode; }

private:
  ErrorCode ecode;
};

} // namespace molly

#endif // MOLLY_XTC_ERROR_H
