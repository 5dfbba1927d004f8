#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/device_registry.hpp"
#include "core/device/protocol/message.hpp"
#include "core/device/transport/connection.hpp"
#include "core/storage/measurement_sink.hpp"

namespace devgw::core::device::session {

// Inbound side of the device protocol. The transport hands every frame of a
// connection to OnFrame from a single thread, so a device's messages are
// processed strictly in arrival order.
class SessionController {
public:
  SessionController(manager::DeviceRegistry& registry,
                    std::shared_ptr<storage::MeasurementSink> sink = nullptr,
                    std::shared_ptr<common::log::Logger> logger = nullptr,
                    common::time::SteadyNowFn now = nullptr);

  void OnOpen(const std::shared_ptr<transport::Connection>& conn);
  void OnFrame(const std::shared_ptr<transport::Connection>& conn, std::string_view frame);
  void OnClose(const std::shared_ptr<transport::Connection>& conn);

  // Transport-level framing failure (e.g. an oversized line). The frame is
  // dropped and an error frame echoed; the link stays open.
  void RejectFrame(const std::shared_ptr<transport::Connection>& conn, const std::string& detail);

  std::uint64_t ProtocolErrorCount() const { return protocol_errors_.load(); }
  std::uint64_t MeasurementCount() const { return measurements_.load(); }

private:
  void HandleRegister(const std::shared_ptr<transport::Connection>& conn,
                      protocol::RegisterMessage msg);
  void HandleSensorFrame(const std::string& device_id, const protocol::SensorFrameMessage& msg);
  void ReplyError(transport::Connection& conn, common::error::ErrorCode code,
                  const std::string& detail);

private:
  manager::DeviceRegistry& registry_;
  std::shared_ptr<storage::MeasurementSink> sink_;
  std::shared_ptr<common::log::Logger> logger_;
  common::time::SteadyNowFn now_;

  std::atomic<std::uint64_t> protocol_errors_{0};
  std::atomic<std::uint64_t> measurements_{0};
};

}  // namespace devgw::core::device::session
