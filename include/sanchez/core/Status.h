// Repository: Sanchez
// Component: Status
// Purpose: Error taxonomy and status values returned by every fallible operation.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_CORE_STATUS_H_
#define SANCHEZ_CORE_STATUS_H_

#include <string>
#include <utility>

namespace sanchez {

// ErrorCode enumerates the distinguishable failure kinds.
enum class ErrorCode {
  kOk = 0,
  kInvalidFormat,      // Bad magic/version or corrupted header; file unusable.
  kCorruptFrame,       // Checksum or length mismatch on one frame.
  kDimensionMismatch,  // Caller buffer does not match width * height * 3.
  kIndexOutOfRange,    // Frame index >= frame_count.
  kIOError,            // Storage or transport failure.
  kSourceUnreadable,   // External codec could not open or decode input.
  kSessionDesync,      // Stream data arrived before METADATA/CONFIG for too long.
  kDisconnected,       // Transport closed or timeout threshold exceeded.
  kTimeout,            // A bounded receive elapsed without a packet.
  kCancelled,          // Caller requested cooperative stop.
};

// Convert ErrorCode to string for logs.
const char* ErrorCodeToString(ErrorCode code);

// Status carries an ErrorCode and a human readable message.
class Status {
 public:
  Status() : code_(ErrorCode::kOk) {}
  Status(ErrorCode code, std::string message)
      : code_(code), message_(std::move(message)) {}

  static Status Ok() { return Status(); }

  [[nodiscard]] bool ok() const { return code_ == ErrorCode::kOk; }
  [[nodiscard]] ErrorCode code() const { return code_; }
  [[nodiscard]] const std::string& message() const { return message_; }

  // Renders "CODE: message" for logging.
  [[nodiscard]] std::string ToString() const;

 private:
  ErrorCode code_;
  std::string message_;
};

}  // namespace sanchez

#endif  // SANCHEZ_CORE_STATUS_H_
