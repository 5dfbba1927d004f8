#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/dispatch/command_dispatcher.hpp"

namespace devgw {
namespace core {
namespace control {

struct CaptureSessionRequest {
  std::string name;
  std::vector<std::string> nodes;
  std::vector<std::string> sensors;
  std::int64_t duration_s = 0;
  std::string retention_policy;
};

struct NodeDelivery {
  std::string device_id;
  common::error::Status status;
};

enum class CaptureStatus : std::uint8_t { Active, Stopped };

const char* ToString(CaptureStatus s);

struct CaptureSession {
  std::string id;
  std::string token;
  std::string name;
  std::vector<std::string> nodes;
  std::vector<std::string> sensors;
  std::int64_t duration_s = 0;
  std::string retention_policy;
  CaptureStatus status = CaptureStatus::Active;
  std::int64_t start_ms = 0;
  std::int64_t end_ms = 0;

  // Outcome of the most recent session_start / session_stop fan-out.
  std::vector<NodeDelivery> start_results;
  std::vector<NodeDelivery> stop_results;

  std::size_t DeliveredCount(const std::vector<NodeDelivery>& results) const;
};

// Operator-level capture sessions that span several devices. Each session
// fans a session_start (and later a session_stop) out to its nodes through
// the dispatcher; a node that is offline or busy is recorded as a failed
// delivery and does not fail the session as a whole.
class CaptureSessionService {
public:
  explicit CaptureSessionService(device::dispatch::CommandDispatcher& dispatcher,
                                 std::shared_ptr<common::log::Logger> logger = nullptr);

  // Rejects a request with no nodes or a blank node id (InvalidCommand).
  common::error::Status Create(const CaptureSessionRequest& req, CaptureSession& out);

  // Returns false for an unknown id. Marks the session active again with a
  // fresh start time and re-sends session_start to every node; a node still
  // running the session reports session_already_active.
  bool Start(const std::string& session_id, CaptureSession& out);

  // Returns false for an unknown id. Stopping a stopped session is a no-op
  // that returns the stored record.
  bool Stop(const std::string& session_id, CaptureSession& out);

  std::optional<CaptureSession> Get(const std::string& session_id) const;
  std::vector<CaptureSession> List() const;
  std::size_t ActiveCount() const;

  static std::string ToJson(const CaptureSession& s);
  std::string ToJsonList() const;

private:
  std::vector<NodeDelivery> FanOut(const std::vector<std::string>& nodes,
                                   const device::protocol::Command& cmd);

private:
  device::dispatch::CommandDispatcher& dispatcher_;
  std::shared_ptr<common::log::Logger> logger_;

  mutable std::mutex mu_;
  std::map<std::string, CaptureSession> sessions_;
  std::vector<std::string> order_;
};

}  // namespace control
}  // namespace core
}  // namespace devgw
