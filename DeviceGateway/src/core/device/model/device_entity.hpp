#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/device/model/device_status.hpp"

namespace devgw {
namespace core {
namespace device {
namespace model {

struct Capability {
  std::string id;
  std::string label;
  bool configurable = false;
  // Last value pushed with config_update, as raw JSON; empty until configured.
  std::string config;
};

struct DeviceEntity {
  std::string id;
  std::string name;
  std::string firmware_version;
  std::vector<Capability> capabilities;
  std::int64_t sampling_rate = 1000;
  std::string camera_resolution;
  bool compression_enabled = false;
  bool ota_enabled = false;
  std::string public_ip;

  // Non-empty exactly while status.state == DeviceState::SessionActive.
  std::string active_session_id;
  DeviceStatus status;

  const Capability* FindCapability(const std::string& cap_id) const {
    for (const auto& c : capabilities) {
      if (c.id == cap_id) return &c;
    }
    return nullptr;
  }

  Capability* FindCapability(const std::string& cap_id) {
    for (auto& c : capabilities) {
      if (c.id == cap_id) return &c;
    }
    return nullptr;
  }
};

}  // namespace model
}  // namespace device
}  // namespace core
}  // namespace devgw
