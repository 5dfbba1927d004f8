#include "core/control/capture_session_service.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/id_utils.hpp"
#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace devgw {
namespace core {
namespace control {

namespace json = devgw::core::common::json;
using common::error::ErrorCode;
using common::error::Status;
using common::log::Level;

const char* ToString(CaptureStatus s) {
  switch (s) {
    case CaptureStatus::Active:  return "active";
    case CaptureStatus::Stopped: return "stopped";
    default:                     return "unknown";
  }
}

std::size_t CaptureSession::DeliveredCount(const std::vector<NodeDelivery>& results) const {
  return static_cast<std::size_t>(std::count_if(results.begin(), results.end(),
                                                [](const NodeDelivery& r) { return r.status.IsOk(); }));
}

CaptureSessionService::CaptureSessionService(device::dispatch::CommandDispatcher& dispatcher,
                                             std::shared_ptr<common::log::Logger> logger)
    : dispatcher_(dispatcher), logger_(std::move(logger)) {}

std::vector<NodeDelivery> CaptureSessionService::FanOut(const std::vector<std::string>& nodes,
                                                        const device::protocol::Command& cmd) {
  std::vector<NodeDelivery> results;
  results.reserve(nodes.size());
  for (const auto& node : nodes) {
    NodeDelivery r;
    r.device_id = node;
    r.status = dispatcher_.Send(node, cmd);
    results.push_back(std::move(r));
  }
  return results;
}

Status CaptureSessionService::Create(const CaptureSessionRequest& req, CaptureSession& out) {
  if (req.nodes.empty()) return Status::Failure(ErrorCode::InvalidCommand, "nodes must not be empty");
  for (const auto& n : req.nodes) {
    if (n.empty()) return Status::Failure(ErrorCode::InvalidCommand, "blank node id");
  }

  CaptureSession s;
  s.id = common::id::NewUuid();
  s.token = common::id::NewUuid();
  s.name = req.name;
  s.nodes = req.nodes;
  s.sensors = req.sensors;
  s.duration_s = req.duration_s;
  s.retention_policy = req.retention_policy;
  s.status = CaptureStatus::Active;
  s.start_ms = common::time::NowUnixMs();

  device::protocol::SessionStartMessage start;
  start.session_id = s.id;
  start.session_token = s.token;
  start.sensors = s.sensors;
  start.duration_s = s.duration_s;
  s.start_results = FanOut(s.nodes, start);

  {
    std::lock_guard<std::mutex> lk(mu_);
    sessions_[s.id] = s;
    order_.push_back(s.id);
  }

  if (logger_) {
    logger_->Log(Level::Info, "capture",
                 "session " + s.id + " created nodes=" + std::to_string(s.nodes.size()) +
                     " started=" + std::to_string(s.DeliveredCount(s.start_results)));
  }
  out = std::move(s);
  return Status::Success();
}

bool CaptureSessionService::Start(const std::string& session_id, CaptureSession& out) {
  device::protocol::SessionStartMessage start;
  std::vector<std::string> nodes;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    CaptureSession& s = it->second;
    s.status = CaptureStatus::Active;
    s.start_ms = common::time::NowUnixMs();
    s.end_ms = 0;
    start.session_id = s.id;
    start.session_token = s.token;
    start.sensors = s.sensors;
    start.duration_s = s.duration_s;
    nodes = s.nodes;
  }

  std::vector<NodeDelivery> results = FanOut(nodes, start);

  std::size_t delivered = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = sessions_[session_id];
    s.start_results = std::move(results);
    delivered = s.DeliveredCount(s.start_results);
    out = s;
  }

  if (logger_) {
    logger_->Log(Level::Info, "capture",
                 "session " + session_id + " restarted delivered=" + std::to_string(delivered));
  }
  return true;
}

bool CaptureSessionService::Stop(const std::string& session_id, CaptureSession& out) {
  std::vector<std::string> nodes;
  {
    std::lock_guard<std::mutex> lk(mu_);
    const auto it = sessions_.find(session_id);
    if (it == sessions_.end()) return false;
    if (it->second.status == CaptureStatus::Stopped) {
      out = it->second;
      return true;
    }
    it->second.status = CaptureStatus::Stopped;
    it->second.end_ms = common::time::NowUnixMs();
    nodes = it->second.nodes;
  }

  device::protocol::SessionStopMessage stop;
  stop.session_id = session_id;
  std::vector<NodeDelivery> results = FanOut(nodes, stop);

  std::size_t delivered = 0;
  {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = sessions_[session_id];
    s.stop_results = std::move(results);
    delivered = s.DeliveredCount(s.stop_results);
    out = s;
  }

  if (logger_) {
    logger_->Log(Level::Info, "capture",
                 "session " + session_id + " stopped delivered=" + std::to_string(delivered));
  }
  return true;
}

std::optional<CaptureSession> CaptureSessionService::Get(const std::string& session_id) const {
  std::lock_guard<std::mutex> lk(mu_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) return std::nullopt;
  return it->second;
}

std::vector<CaptureSession> CaptureSessionService::List() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::vector<CaptureSession> out;
  out.reserve(order_.size());
  for (const auto& id : order_) out.push_back(sessions_.at(id));
  return out;
}

std::size_t CaptureSessionService::ActiveCount() const {
  std::lock_guard<std::mutex> lk(mu_);
  std::size_t n = 0;
  for (const auto& kv : sessions_) {
    if (kv.second.status == CaptureStatus::Active) ++n;
  }
  return n;
}

namespace {

static std::string DeliveriesToJson(const std::vector<NodeDelivery>& results) {
  std::vector<std::string> items;
  items.reserve(results.size());
  for (const auto& r : results) {
    std::vector<std::pair<std::string, std::string>> fields = {
        {"deviceId", json::Quote(r.device_id)},
        {"ok", json::Bool(r.status.IsOk())},
    };
    if (!r.status.IsOk()) {
      fields.emplace_back("error", json::Quote(common::error::ToString(r.status.Code())));
      fields.emplace_back("detail", json::Quote(r.status.Message()));
    }
    items.push_back(json::Object(fields));
  }
  return json::Array(items);
}

}  // namespace

std::string CaptureSessionService::ToJson(const CaptureSession& s) {
  return json::Object({
      {"sessionId", json::Quote(s.id)},
      {"sessionToken", json::Quote(s.token)},
      {"name", json::Quote(s.name)},
      {"nodes", json::StringArray(s.nodes)},
      {"sensors", json::StringArray(s.sensors)},
      {"duration", json::Number(s.duration_s)},
      {"retentionPolicy", s.retention_policy.empty() ? "null" : json::Quote(s.retention_policy)},
      {"status", json::Quote(ToString(s.status))},
      {"startTime", json::Quote(common::time::FormatIso8601Utc(s.start_ms))},
      {"endTime", s.end_ms == 0 ? "null" : json::Quote(common::time::FormatIso8601Utc(s.end_ms))},
      {"startResults", DeliveriesToJson(s.start_results)},
      {"stopResults", DeliveriesToJson(s.stop_results)},
  });
}

std::string CaptureSessionService::ToJsonList() const {
  std::vector<std::string> items;
  for (const auto& s : List()) items.push_back(ToJson(s));
  return json::Array(items);
}

}  // namespace control
}  // namespace core
}  // namespace devgw
