#include "core/device/session/session_state_machine.hpp"

#include <string>
#include <utility>

namespace devgw::core::device::session {

using common::error::ErrorCode;
using model::DeviceState;

namespace {

Transition Reject(ErrorCode code, std::string detail) {
  Transition t;
  t.error = code;
  t.detail = std::move(detail);
  return t;
}

Transition Stay(const model::DeviceEntity& d) {
  Transition t;
  t.next = d.status.state;
  t.active_session_id = d.active_session_id;
  return t;
}

Transition MoveTo(DeviceState next, std::string session_id = std::string()) {
  Transition t;
  t.next = next;
  t.active_session_id = std::move(session_id);
  return t;
}

struct Evaluator {
  const model::DeviceEntity& d;

  DeviceState state() const { return d.status.state; }

  Transition operator()(const RegistrationCompleted&) const {
    if (state() == DeviceState::Registered) return MoveTo(DeviceState::Idle);
    return Reject(ErrorCode::InvalidState,
                  std::string("registration already completed, state=") + model::ToString(state()));
  }

  Transition operator()(const SessionStartRequested& ev) const {
    switch (state()) {
      case DeviceState::Idle:
        if (ev.session_id.empty()) return Reject(ErrorCode::InvalidCommand, "empty session id");
        return MoveTo(DeviceState::SessionActive, ev.session_id);
      case DeviceState::SessionActive:
        return Reject(ErrorCode::SessionAlreadyActive, "active session " + d.active_session_id);
      default:
        return Reject(ErrorCode::InvalidState, std::string("state=") + model::ToString(state()));
    }
  }

  Transition operator()(const SessionStopRequested& ev) const {
    switch (state()) {
      case DeviceState::SessionActive:
        if (!ev.session_id.empty() && ev.session_id != d.active_session_id) {
          return Reject(ErrorCode::SessionMismatch,
                        "active session is " + d.active_session_id + ", not " + ev.session_id);
        }
        return MoveTo(DeviceState::Idle);
      case DeviceState::Idle:
        return Reject(ErrorCode::NoActiveSession, "device is idle");
      default:
        return Reject(ErrorCode::InvalidState, std::string("state=") + model::ToString(state()));
    }
  }

  Transition operator()(const ConfigUpdateRequested& ev) const {
    if (state() != DeviceState::Idle && state() != DeviceState::SessionActive) {
      return Reject(ErrorCode::InvalidState, std::string("state=") + model::ToString(state()));
    }
    if (ev.config.empty()) return Reject(ErrorCode::InvalidCommand, "empty config");

    for (const auto& kv : ev.config) {
      const model::Capability* cap = d.FindCapability(kv.first);
      if (cap == nullptr) {
        return Reject(ErrorCode::UnsupportedCapability, "unknown capability '" + kv.first + "'");
      }
      if (!cap->configurable) {
        return Reject(ErrorCode::UnsupportedCapability,
                      "capability '" + kv.first + "' is not configurable");
      }
    }
    Transition t = Stay(d);
    t.config = ev.config;
    return t;
  }

  Transition operator()(const ConnectionLost&) const { return MoveTo(DeviceState::Disconnected); }
};

}  // namespace

Transition Evaluate(const model::DeviceEntity& device, const Trigger& trigger) {
  if (device.status.state == DeviceState::Disconnected) {
    return Reject(ErrorCode::DeviceNotConnected, "device " + device.id + " is disconnected");
  }
  return std::visit(Evaluator{device}, trigger);
}

void Apply(model::DeviceEntity& device, const Transition& t) {
  if (!t.IsOk()) return;
  device.status.state = t.next;
  device.active_session_id =
      (t.next == DeviceState::SessionActive) ? t.active_session_id : std::string();
  for (const auto& kv : t.config) {
    model::Capability* cap = device.FindCapability(kv.first);
    if (cap != nullptr) cap->config = kv.second;
  }
}

}  // namespace devgw::core::device::session
