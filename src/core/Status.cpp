// Repository: Sanchez
// Component: Status
// Purpose: Error taxonomy and status values returned by every fallible operation.
// Copyright (c) 2025 Sanchez

#include "sanchez/core/Status.h"

namespace sanchez {

const char* ErrorCodeToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "OK";
    case ErrorCode::kInvalidFormat:
      return "INVALID_FORMAT";
    case ErrorCode::kCorruptFrame:
      return "CORRUPT_FRAME";
    case ErrorCode::kDimensionMismatch:
      return "DIMENSION_MISMATCH";
    case ErrorCode::kIndexOutOfRange:
      return "INDEX_OUT_OF_RANGE";
    case ErrorCode::kIOError:
      return "IO_ERROR";
    case ErrorCode::kSourceUnreadable:
      return "SOURCE_UNREADABLE";
    case ErrorCode::kSessionDesync:
      return "SESSION_DESYNC";
    case ErrorCode::kDisconnected:
      return "DISCONNECTED";
    case ErrorCode::kTimeout:
      return "TIMEOUT";
    case ErrorCode::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

std::string Status::ToString() const {
  if (ok()) {
    return "OK";
  }
  std::string text = ErrorCodeToString(code_);
  if (!message_.empty()) {
    text += ": ";
    text += message_;
  }
  return text;
}

}  // namespace sanchez
