#include "core/device/protocol/message.hpp"

#include <set>
#include <string>
#include <utility>

#include "core/common/utils/json_utils.hpp"

namespace devgw::core::device::protocol {

namespace json = devgw::core::common::json;

namespace {

constexpr std::int64_t kDefaultSamplingRateMs = 1000;
constexpr const char* kDefaultFirmwareVersion = "1.0.0";

template <typename... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <typename... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

bool ReadOptionalString(std::string_view js, const char* path, std::string& out, std::string& error) {
  const json::Kind k = json::KindAt(js, path);
  if (k == json::Kind::Missing || k == json::Kind::Null) return true;
  if (k != json::Kind::String || !json::GetString(js, path, out)) {
    error = std::string("field ") + (path + 2) + " must be a string";
    return false;
  }
  return true;
}

bool ReadOptionalBool(std::string_view js, const char* path, bool& out, std::string& error) {
  const json::Kind k = json::KindAt(js, path);
  if (k == json::Kind::Missing || k == json::Kind::Null) return true;
  if (k != json::Kind::Bool || !json::GetBool(js, path, out)) {
    error = std::string("field ") + (path + 2) + " must be a boolean";
    return false;
  }
  return true;
}

}  // namespace

bool DecodeCapabilities(std::string_view js, std::vector<model::Capability>& out, std::string& error) {
  const json::Kind k = json::KindAt(js, "$.capabilities");
  if (k == json::Kind::Missing || k == json::Kind::Null) return true;
  if (k != json::Kind::Array) {
    error = "field capabilities must be an array";
    return false;
  }

  std::string token;
  if (!json::GetRaw(js, "$.capabilities", token)) {
    error = "field capabilities is malformed";
    return false;
  }

  std::set<std::string> seen;
  bool ok = true;
  (void)json::ForEach(token, [&](std::string_view, std::string_view item) {
    if (!ok) return;
    if (json::KindAt(item, "$") != json::Kind::Object) {
      error = "capability entries must be objects";
      ok = false;
      return;
    }
    model::Capability cap;
    if (!json::GetString(item, "$.id", cap.id) || cap.id.empty()) {
      error = "capability id must be a non-empty string";
      ok = false;
      return;
    }
    if (!seen.insert(cap.id).second) {
      error = "duplicate capability id '" + cap.id + "'";
      ok = false;
      return;
    }
    if (!ReadOptionalString(item, "$.label", cap.label, error) ||
        !ReadOptionalBool(item, "$.configurable", cap.configurable, error)) {
      ok = false;
      return;
    }
    if (cap.label.empty()) cap.label = cap.id;
    out.push_back(std::move(cap));
  });
  return ok;
}

namespace {

bool DecodeRegister(std::string_view js, RegisterMessage& out, std::string& error) {
  model::DeviceEntity& d = out.device;

  if (json::KindAt(js, "$.deviceId") != json::Kind::String ||
      !json::GetString(js, "$.deviceId", d.id) || d.id.empty()) {
    error = "register requires a non-empty deviceId";
    return false;
  }

  if (!ReadOptionalString(js, "$.name", d.name, error)) return false;
  if (!ReadOptionalString(js, "$.firmwareVersion", d.firmware_version, error)) return false;
  if (!ReadOptionalString(js, "$.cameraResolution", d.camera_resolution, error)) return false;
  if (!ReadOptionalBool(js, "$.compressionEnabled", d.compression_enabled, error)) return false;
  if (!ReadOptionalBool(js, "$.otaEnabled", d.ota_enabled, error)) return false;
  if (!DecodeCapabilities(js, d.capabilities, error)) return false;

  if (d.name.empty()) d.name = "ESP32-" + d.id.substr(0, 8);
  if (d.firmware_version.empty()) d.firmware_version = kDefaultFirmwareVersion;

  d.sampling_rate = kDefaultSamplingRateMs;
  const json::Kind rate_kind = json::KindAt(js, "$.samplingRate");
  if (rate_kind != json::Kind::Missing && rate_kind != json::Kind::Null) {
    std::int64_t rate = 0;
    if (!json::GetInt64(js, "$.samplingRate", rate) || rate <= 0) {
      error = "samplingRate must be a positive integer";
      return false;
    }
    d.sampling_rate = rate;
  }
  return true;
}

bool DecodeConfigUpdate(std::string_view js, ConfigUpdateMessage& out, std::string& error) {
  std::string token;
  if (json::KindAt(js, "$.config") != json::Kind::Object || !json::GetRaw(js, "$.config", token)) {
    error = "config_update requires a config object";
    return false;
  }
  (void)json::ForEach(token, [&](std::string_view key, std::string_view value) {
    out.config.emplace_back(std::string(key), std::string(value));
  });
  return true;
}

bool DecodeSessionStart(std::string_view js, SessionStartMessage& out, std::string& error) {
  if (!ReadOptionalString(js, "$.sessionId", out.session_id, error)) return false;
  if (!ReadOptionalString(js, "$.sessionToken", out.session_token, error)) return false;
  if (json::KindAt(js, "$.sensors") == json::Kind::Array &&
      !json::GetStringArray(js, "$.sensors", out.sensors)) {
    error = "sensors must be an array of strings";
    return false;
  }
  if (json::KindAt(js, "$.duration") == json::Kind::Number &&
      !json::GetInt64(js, "$.duration", out.duration_s)) {
    error = "duration must be an integer";
    return false;
  }
  return true;
}

bool DecodeSessionStop(std::string_view js, SessionStopMessage& out, std::string& error) {
  return ReadOptionalString(js, "$.sessionId", out.session_id, error);
}

bool DecodeSensorFrame(std::string_view js, SensorFrameMessage& out, std::string& error) {
  if (!ReadOptionalString(js, "$.frameId", out.frame_id, error)) return false;
  if (!ReadOptionalString(js, "$.sensor", out.sensor, error)) return false;
  if (json::KindAt(js, "$.timestamp") == json::Kind::Number) {
    (void)json::GetInt64(js, "$.timestamp", out.timestamp_ms);
  }
  if (!json::GetRaw(js, "$.data", out.payload)) out.payload.assign(js.data(), js.size());
  return true;
}

}  // namespace

const char* ToString(MessageType t) {
  switch (t) {
    case MessageType::Register:     return "register";
    case MessageType::Heartbeat:    return "heartbeat";
    case MessageType::ConfigUpdate: return "config_update";
    case MessageType::SessionStart: return "session_start";
    case MessageType::SessionStop:  return "session_stop";
    case MessageType::SensorFrame:  return "sensor_frame";
    case MessageType::AiLog:        return "ai_log";
    default:                        return "unknown";
  }
}

MessageType TypeOf(const Message& m) {
  return std::visit(Overloaded{
                        [](const RegisterMessage&) { return MessageType::Register; },
                        [](const HeartbeatMessage&) { return MessageType::Heartbeat; },
                        [](const ConfigUpdateMessage&) { return MessageType::ConfigUpdate; },
                        [](const SessionStartMessage&) { return MessageType::SessionStart; },
                        [](const SessionStopMessage&) { return MessageType::SessionStop; },
                        [](const SensorFrameMessage&) { return MessageType::SensorFrame; },
                        [](const AiLogMessage&) { return MessageType::AiLog; },
                    },
                    m);
}

MessageType TypeOf(const Command& c) {
  return std::visit(Overloaded{
                        [](const ConfigUpdateMessage&) { return MessageType::ConfigUpdate; },
                        [](const SessionStartMessage&) { return MessageType::SessionStart; },
                        [](const SessionStopMessage&) { return MessageType::SessionStop; },
                    },
                    c);
}

bool IsDeviceOriginated(MessageType t) {
  return t == MessageType::Register || t == MessageType::Heartbeat ||
         t == MessageType::SensorFrame || t == MessageType::AiLog;
}

bool Decode(std::string_view text, Message& out, std::string& error) {
  if (!json::IsObject(text)) {
    error = "frame is not a JSON object";
    return false;
  }

  std::string type;
  if (!json::GetString(text, "$.type", type) || type.empty()) {
    error = "missing type";
    return false;
  }

  if (type == "register") {
    RegisterMessage m;
    if (!DecodeRegister(text, m, error)) return false;
    out = std::move(m);
  } else if (type == "heartbeat") {
    out = HeartbeatMessage{};
  } else if (type == "config_update") {
    ConfigUpdateMessage m;
    if (!DecodeConfigUpdate(text, m, error)) return false;
    out = std::move(m);
  } else if (type == "session_start") {
    SessionStartMessage m;
    if (!DecodeSessionStart(text, m, error)) return false;
    out = std::move(m);
  } else if (type == "session_stop") {
    SessionStopMessage m;
    if (!DecodeSessionStop(text, m, error)) return false;
    out = std::move(m);
  } else if (type == "sensor_frame") {
    SensorFrameMessage m;
    if (!DecodeSensorFrame(text, m, error)) return false;
    out = std::move(m);
  } else if (type == "ai_log") {
    AiLogMessage m;
    if (!ReadOptionalString(text, "$.event", m.event, error)) return false;
    m.payload.assign(text.data(), text.size());
    out = std::move(m);
  } else {
    error = "unknown type '" + type + "'";
    return false;
  }
  return true;
}

std::string Encode(const Command& cmd) {
  return std::visit(
      Overloaded{
          [](const ConfigUpdateMessage& m) {
            return json::Object({
                {"type", json::Quote("config_update")},
                {"config", json::Object(m.config)},
            });
          },
          [](const SessionStartMessage& m) {
            std::vector<std::pair<std::string, std::string>> fields = {
                {"type", json::Quote("session_start")},
                {"sessionId", json::Quote(m.session_id)},
            };
            if (!m.session_token.empty()) fields.emplace_back("sessionToken", json::Quote(m.session_token));
            if (!m.sensors.empty()) fields.emplace_back("sensors", json::StringArray(m.sensors));
            if (m.duration_s > 0) fields.emplace_back("duration", json::Number(m.duration_s));
            return json::Object(fields);
          },
          [](const SessionStopMessage& m) {
            return json::Object({
                {"type", json::Quote("session_stop")},
                {"sessionId", json::Quote(m.session_id)},
            });
          },
      },
      cmd);
}

std::string EncodeRegistrationAck(const std::string& device_id) {
  return json::Object({
      {"type", json::Quote("registration_ack")},
      {"deviceId", json::Quote(device_id)},
      {"status", json::Quote("success")},
  });
}

std::string EncodeError(common::error::ErrorCode code, std::string_view detail) {
  return json::Object({
      {"type", json::Quote("error")},
      {"error", json::Quote(common::error::ToString(code))},
      {"detail", json::Quote(detail)},
  });
}

}  // namespace devgw::core::device::protocol
