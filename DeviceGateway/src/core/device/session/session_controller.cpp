#include "core/device/session/session_controller.hpp"

#include <string>
#include <utility>
#include <variant>

#include "core/device/session/session_state_machine.hpp"

namespace devgw::core::device::session {

using common::error::ErrorCode;
using common::log::Level;

SessionController::SessionController(manager::DeviceRegistry& registry,
                                     std::shared_ptr<storage::MeasurementSink> sink,
                                     std::shared_ptr<common::log::Logger> logger,
                                     common::time::SteadyNowFn now)
    : registry_(registry),
      sink_(std::move(sink)),
      logger_(std::move(logger)),
      now_(now ? std::move(now) : common::time::SteadyNowFn(&common::time::SteadyNow)) {}

void SessionController::OnOpen(const std::shared_ptr<transport::Connection>& conn) {
  if (logger_) logger_->Log(Level::Debug, "session", "link open peer=" + conn->Peer());
}

void SessionController::OnClose(const std::shared_ptr<transport::Connection>& conn) {
  const std::string device_id = conn->DeviceId();
  conn->UnbindDevice();
  if (device_id.empty()) {
    if (logger_) logger_->Log(Level::Debug, "session", "unregistered link closed peer=" + conn->Peer());
    return;
  }
  (void)registry_.RemoveIfBound(device_id, conn.get(), manager::RemovalReason::ConnectionClosed);
}

void SessionController::RejectFrame(const std::shared_ptr<transport::Connection>& conn,
                                    const std::string& detail) {
  protocol_errors_.fetch_add(1);
  if (logger_) {
    logger_->Log(Level::Warn, "session", "protocol error from " + conn->Peer() + ": " + detail);
  }
  ReplyError(*conn, ErrorCode::ProtocolError, detail);
}

void SessionController::ReplyError(transport::Connection& conn, ErrorCode code,
                                   const std::string& detail) {
  if (!conn.Send(protocol::EncodeError(code, detail)) && logger_) {
    logger_->Log(Level::Debug, "session", "error frame dropped, link closing peer=" + conn.Peer());
  }
}

void SessionController::OnFrame(const std::shared_ptr<transport::Connection>& conn,
                                std::string_view frame) {
  protocol::Message msg;
  std::string error;
  if (!protocol::Decode(frame, msg, error)) {
    RejectFrame(conn, error);
    return;
  }

  const protocol::MessageType type = protocol::TypeOf(msg);
  if (type == protocol::MessageType::Register) {
    HandleRegister(conn, std::get<protocol::RegisterMessage>(std::move(msg)));
    return;
  }

  const std::string device_id = conn->DeviceId();
  if (device_id.empty() ||
      !registry_.Touch(device_id, common::time::NowUnixMs(), now_(), conn.get())) {
    protocol_errors_.fetch_add(1);
    ReplyError(*conn, ErrorCode::ProtocolError,
               std::string("not_registered: ") + protocol::ToString(type) + " before register");
    return;
  }

  if (!protocol::IsDeviceOriginated(type)) {
    protocol_errors_.fetch_add(1);
    ReplyError(*conn, ErrorCode::ProtocolError,
               std::string("unexpected_message: ") + protocol::ToString(type) +
                   " is sent by the gateway, not the device");
    return;
  }

  switch (type) {
    case protocol::MessageType::Heartbeat:
      if (logger_ && logger_->IsEnabled(Level::Trace)) {
        logger_->Log(Level::Trace, "session", "heartbeat " + device_id);
      }
      break;
    case protocol::MessageType::SensorFrame:
      HandleSensorFrame(device_id, std::get<protocol::SensorFrameMessage>(msg));
      break;
    case protocol::MessageType::AiLog:
      if (logger_) {
        logger_->Log(Level::Info, "ai_log",
                     device_id + " event=" + std::get<protocol::AiLogMessage>(msg).event);
      }
      break;
    default:
      break;
  }
}

void SessionController::HandleRegister(const std::shared_ptr<transport::Connection>& conn,
                                       protocol::RegisterMessage msg) {
  model::DeviceEntity& d = msg.device;
  const std::string id = d.id;

  if (!conn->DeviceId().empty() && conn->DeviceId() != id) {
    protocol_errors_.fetch_add(1);
    ReplyError(*conn, ErrorCode::ProtocolError,
               "link already registered as " + conn->DeviceId());
    return;
  }

  d.public_ip = conn->Peer();
  d.status.last_seen_ms = common::time::NowUnixMs();
  d.status.connected_at_ms = d.status.last_seen_ms;
  d.status.last_activity = now_();

  const manager::RegisterResult res = registry_.Register(std::move(d), conn);
  if (!res.ok) {
    protocol_errors_.fetch_add(1);
    ReplyError(*conn, ErrorCode::ProtocolError, "registration rejected");
    return;
  }
  conn->BindDevice(id);

  // Ack under the device lock so no command can overtake it.
  const bool live = registry_.WithDevice(id, [&](model::DeviceEntity& entity,
                                                 transport::Connection& link) {
    const Transition t = Evaluate(entity, RegistrationCompleted{});
    Apply(entity, t);
    if (!link.Send(protocol::EncodeRegistrationAck(id)) && logger_) {
      logger_->Log(Level::Warn, "session", "registration ack not sent to " + id);
    }
  });
  if (!live && logger_) {
    logger_->Log(Level::Warn, "session", "device " + id + " went away during registration");
  }
  if (res.replaced_existing && logger_) {
    logger_->Log(Level::Info, "session", "device " + id + " reconnected; prior session dropped");
  }
}

void SessionController::HandleSensorFrame(const std::string& device_id,
                                          const protocol::SensorFrameMessage& msg) {
  if (!sink_) return;
  const auto d = registry_.Lookup(device_id);
  if (!d) return;

  storage::Measurement m;
  m.device_id = device_id;
  m.timestamp_ms = msg.timestamp_ms > 0 ? msg.timestamp_ms : d->status.last_seen_ms;
  m.session_id = d->active_session_id;
  m.sensor = msg.sensor;
  m.payload = msg.payload;
  if (sink_->Store(m)) {
    measurements_.fetch_add(1);
  } else if (logger_) {
    logger_->Log(Level::Warn, "session", "measurement from " + device_id + " not stored");
  }
}

}  // namespace devgw::core::device::session
