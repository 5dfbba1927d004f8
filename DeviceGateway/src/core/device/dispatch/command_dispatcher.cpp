#include "core/device/dispatch/command_dispatcher.hpp"

#include <utility>
#include <variant>

#include "core/common/utils/id_utils.hpp"
#include "core/device/session/session_state_machine.hpp"

namespace devgw::core::device::dispatch {

using common::error::ErrorCode;
using common::error::Status;

namespace {

session::Trigger ToTrigger(const protocol::Command& cmd) {
  if (const auto* m = std::get_if<protocol::ConfigUpdateMessage>(&cmd)) {
    return session::ConfigUpdateRequested{m->config};
  }
  if (const auto* m = std::get_if<protocol::SessionStartMessage>(&cmd)) {
    return session::SessionStartRequested{m->session_id};
  }
  const auto& stop = std::get<protocol::SessionStopMessage>(cmd);
  return session::SessionStopRequested{stop.session_id};
}

}  // namespace

CommandDispatcher::CommandDispatcher(manager::DeviceRegistry& registry,
                                     std::shared_ptr<common::log::Logger> logger)
    : registry_(registry), logger_(std::move(logger)) {}

Status CommandDispatcher::Send(const std::string& device_id, const protocol::Command& cmd) {
  protocol::Command out = cmd;
  if (auto* start = std::get_if<protocol::SessionStartMessage>(&out)) {
    if (start->session_id.empty()) start->session_id = common::id::NewUuid();
  }
  const session::Trigger trigger = ToTrigger(out);
  const char* type = protocol::ToString(protocol::TypeOf(out));

  Status st;
  const bool found =
      registry_.WithDevice(device_id, [&](model::DeviceEntity& d, transport::Connection& conn) {
        const session::Transition t = session::Evaluate(d, trigger);
        if (!t.IsOk()) {
          st = t.ToStatus();
          return;
        }
        auto* stop = std::get_if<protocol::SessionStopMessage>(&out);
        if (stop != nullptr && stop->session_id.empty()) stop->session_id = d.active_session_id;
        if (!conn.Send(protocol::Encode(out))) {
          st = Status::Failure(ErrorCode::SendFailed, "connection is closing");
          return;
        }
        session::Apply(d, t);
      });
  if (!found) {
    st = Status::Failure(ErrorCode::DeviceNotConnected, "device " + device_id + " is not connected");
  }

  if (st.IsOk()) {
    sent_.fetch_add(1);
    if (logger_) logger_->Log(common::log::Level::Info, "dispatch", std::string(type) + " -> " + device_id);
  } else {
    failed_.fetch_add(1);
    if (logger_) {
      logger_->Log(common::log::Level::Warn, "dispatch",
                   std::string(type) + " -> " + device_id + " rejected: " + st.ToString());
    }
  }
  return st;
}

}  // namespace devgw::core::device::dispatch
