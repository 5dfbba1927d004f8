#pragma once

#include <cstdint>

#include "core/common/utils/time_utils.hpp"

namespace devgw {
namespace core {
namespace device {
namespace model {

enum class DeviceState : std::uint8_t {
  Registered,
  Idle,
  SessionActive,
  Disconnected
};

inline const char* ToString(DeviceState s) {
  switch (s) {
    case DeviceState::Registered:    return "registered";
    case DeviceState::Idle:          return "idle";
    case DeviceState::SessionActive: return "session_active";
    case DeviceState::Disconnected:  return "disconnected";
    default:                         return "unknown";
  }
}

struct DeviceStatus {
  DeviceState state = DeviceState::Registered;
  std::int64_t connected_at_ms = 0;
  // Reported wall-clock time of the latest message; never moves backwards.
  std::int64_t last_seen_ms = 0;
  // Monotonic instant of the latest message; drives heartbeat timeouts.
  common::time::SteadyTime last_activity{};
};

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devgw
