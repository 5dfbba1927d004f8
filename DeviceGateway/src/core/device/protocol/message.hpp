#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "core/common/error/error.hpp"
#include "core/device/model/device_entity.hpp"

namespace devgw::core::device::protocol {

enum class MessageType : std::uint8_t {
  Register,
  Heartbeat,
  ConfigUpdate,
  SessionStart,
  SessionStop,
  SensorFrame,
  AiLog
};

const char* ToString(MessageType t);

// device -> gateway. Only identity and capability fields of `device` are set.
struct RegisterMessage {
  model::DeviceEntity device;
};

struct HeartbeatMessage {};

// gateway -> device. Values are raw JSON keyed by capability id, in
// submission order.
struct ConfigUpdateMessage {
  std::vector<std::pair<std::string, std::string>> config;
};

struct SessionStartMessage {
  std::string session_id;
  std::string session_token;
  std::vector<std::string> sensors;
  std::int64_t duration_s = 0;
};

struct SessionStopMessage {
  std::string session_id;
};

// device -> gateway, only meaningful while a capture session runs.
struct SensorFrameMessage {
  std::string frame_id;
  std::string sensor;
  std::int64_t timestamp_ms = 0;
  std::string payload;
};

struct AiLogMessage {
  std::string event;
  std::string payload;
};

using Message = std::variant<RegisterMessage, HeartbeatMessage, ConfigUpdateMessage,
                             SessionStartMessage, SessionStopMessage, SensorFrameMessage,
                             AiLogMessage>;

using Command = std::variant<ConfigUpdateMessage, SessionStartMessage, SessionStopMessage>;

MessageType TypeOf(const Message& m);
MessageType TypeOf(const Command& c);

bool IsDeviceOriginated(MessageType t);

// Parses one frame. On failure returns false and sets `error` to a short
// reason suitable for an error frame; `out` is left untouched.
bool Decode(std::string_view text, Message& out, std::string& error);

// Reads the optional `capabilities` array of `js`. Entries need a unique
// non-empty id; label defaults to the id.
bool DecodeCapabilities(std::string_view js, std::vector<model::Capability>& out, std::string& error);

std::string Encode(const Command& cmd);
std::string EncodeRegistrationAck(const std::string& device_id);
std::string EncodeError(common::error::ErrorCode code, std::string_view detail);

}  // namespace devgw::core::device::protocol
