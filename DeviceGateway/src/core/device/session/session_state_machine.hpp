#pragma once

#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "core/common/error/error.hpp"
#include "core/device/model/device_entity.hpp"

namespace devgw::core::device::session {

struct RegistrationCompleted {};

struct SessionStartRequested {
  std::string session_id;
};

// An empty id stops whatever session is active.
struct SessionStopRequested {
  std::string session_id;
};

struct ConfigUpdateRequested {
  std::vector<std::pair<std::string, std::string>> config;
};

struct ConnectionLost {};

using Trigger = std::variant<RegistrationCompleted, SessionStartRequested, SessionStopRequested,
                             ConfigUpdateRequested, ConnectionLost>;

// Outcome of evaluating a trigger against a device. On error nothing about
// the device may change; on success Apply() commits it.
struct Transition {
  common::error::ErrorCode error = common::error::ErrorCode::Ok;
  std::string detail;

  model::DeviceState next = model::DeviceState::Registered;
  std::string active_session_id;
  std::vector<std::pair<std::string, std::string>> config;

  bool IsOk() const { return error == common::error::ErrorCode::Ok; }
  common::error::Status ToStatus() const { return common::error::Status(error, detail); }
};

// The whole per-device state machine: one pure function over (state, trigger).
Transition Evaluate(const model::DeviceEntity& device, const Trigger& trigger);

void Apply(model::DeviceEntity& device, const Transition& t);

}  // namespace devgw::core::device::session
