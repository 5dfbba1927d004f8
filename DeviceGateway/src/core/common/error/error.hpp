#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace devgw::core::common::error {

enum class ErrorCode : std::uint8_t {
  Ok = 0,
  ProtocolError,
  UnsupportedCapability,
  SessionAlreadyActive,
  NoActiveSession,
  SessionMismatch,
  DeviceNotConnected,
  InvalidState,
  InvalidCommand,
  SendFailed
};

// Wire name used in error frames and REST bodies.
inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                    return "ok";
    case ErrorCode::ProtocolError:         return "protocol_error";
    case ErrorCode::UnsupportedCapability: return "unsupported_capability";
    case ErrorCode::SessionAlreadyActive:  return "session_already_active";
    case ErrorCode::NoActiveSession:       return "no_active_session";
    case ErrorCode::SessionMismatch:       return "session_mismatch";
    case ErrorCode::DeviceNotConnected:    return "device_not_connected";
    case ErrorCode::InvalidState:          return "invalid_state";
    case ErrorCode::InvalidCommand:        return "invalid_command";
    case ErrorCode::SendFailed:            return "send_failed";
    default:                               return "unknown";
  }
}

class Status {
public:
  Status() = default;
  Status(ErrorCode code, std::string message) : code_(code), message_(std::move(message)) {}

  static Status Success() { return Status(); }
  static Status Failure(ErrorCode code, std::string message = std::string()) {
    return Status(code, std::move(message));
  }

  bool IsOk() const { return code_ == ErrorCode::Ok; }
  explicit operator bool() const { return IsOk(); }

  ErrorCode Code() const { return code_; }
  const std::string& Message() const { return message_; }

  std::string ToString() const {
    if (IsOk()) return "ok";
    std::string out = error::ToString(code_);
    if (!message_.empty()) out += ": " + message_;
    return out;
  }

private:
  ErrorCode code_{ErrorCode::Ok};
  std::string message_;
};

}  // namespace devgw::core::common::error
