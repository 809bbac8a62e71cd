/*
 * Copyright (c) 2020, Nikolay A. Krylov
 * All rights reserved.
 *
 * molly - error reporting
 */

#include "xtc_error.h"

namespace molly {

const char *error_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::WrongMagicNumber:
    return "WrongMagicNumber";
  case ErrorCode::EmptyOrInvalidTrajectory:
    return "EmptyOrInvalidTrajectory";
  case ErrorCode::TruncatedInput:
    return "TruncatedInput";
  case ErrorCode::CorruptFrame:
    return "CorruptFrame";
  case ErrorCode::EndOfTrajectory:
    return "EndOfTrajectory";
  case ErrorCode::ShapeMismatch:
    return "ShapeMismatch";
  case ErrorCode::OutOfRangeSelection:
    return "OutOfRangeSelection";
  case ErrorCode::InvalidSelection:
    return "InvalidSelection";
  case ErrorCode::ReaderClosed:
    return "ReaderClosed";
  case ErrorCode::IoError:
    return "IoError";
  }
  return "Unknown";
}

XTCError::XTCError(ErrorCode code, const std::string &msg)
    : std::runtime_error(std::string(error_name(code)) + ": " + msg),
      ecode(code) {}

} // namespace molly
