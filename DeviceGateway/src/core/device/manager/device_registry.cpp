#include "core/device/manager/device_registry.hpp"

#include <algorithm>
#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "core/common/utils/json_utils.hpp"

namespace devgw {
namespace core {
namespace device {
namespace manager {

namespace json = devgw::core::common::json;

const char* ToString(RemovalReason r) {
  switch (r) {
    case RemovalReason::ConnectionClosed: return "connection_closed";
    case RemovalReason::HeartbeatTimeout: return "heartbeat_timeout";
    case RemovalReason::Superseded:       return "superseded";
    case RemovalReason::Shutdown:         return "shutdown";
    case RemovalReason::Explicit:         return "explicit";
    default:                              return "unknown";
  }
}

DeviceRegistry::DeviceRegistry(std::shared_ptr<common::log::Logger> logger)
    : logger_(std::move(logger)) {}

void DeviceRegistry::AddObserver(Observer observer) {
  if (observer) observers_.push_back(std::move(observer));
}

std::shared_ptr<DeviceRegistry::Slot> DeviceRegistry::FindSlot(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  const auto it = by_id_.find(id);
  if (it == by_id_.end()) return nullptr;
  return it->second;
}

std::vector<std::shared_ptr<DeviceRegistry::Slot>> DeviceRegistry::AllSlots() const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  std::vector<std::shared_ptr<Slot>> out;
  out.reserve(by_id_.size());
  for (const auto& kv : by_id_) out.push_back(kv.second);
  return out;
}

model::DeviceEntity DeviceRegistry::RetireLocked(Slot& slot) {
  slot.removed = true;
  slot.device.status.state = model::DeviceState::Disconnected;
  slot.device.active_session_id.clear();
  if (slot.conn) {
    slot.conn->Close();
    slot.conn.reset();
  }
  return slot.device;
}

void DeviceRegistry::EraseIfCurrent(const std::string& id, const std::shared_ptr<Slot>& slot) {
  std::unique_lock<std::shared_mutex> lk(map_mu_);
  const auto it = by_id_.find(id);
  if (it != by_id_.end() && it->second == slot) by_id_.erase(it);
}

void DeviceRegistry::Notify(const RegistryEvent& ev) const {
  for (const auto& o : observers_) o(ev);
}

RegisterResult DeviceRegistry::Register(model::DeviceEntity device,
                                        std::shared_ptr<transport::Connection> conn) {
  RegisterResult res;
  if (device.id.empty() || !conn) return res;

  const std::string id = device.id;
  device.status.state = model::DeviceState::Registered;
  device.active_session_id.clear();
  if (device.status.last_seen_ms == 0) device.status.last_seen_ms = common::time::NowUnixMs();
  if (device.status.connected_at_ms == 0) device.status.connected_at_ms = device.status.last_seen_ms;
  if (device.status.last_activity == common::time::SteadyTime{}) {
    device.status.last_activity = common::time::SteadyNow();
  }
  if (device.public_ip.empty()) device.public_ip = conn->Peer();

  auto slot = std::make_shared<Slot>();
  slot->device = std::move(device);
  slot->conn = conn;

  RegistryEvent registered;
  registered.kind = RegistryEvent::Kind::Registered;
  registered.device = slot->device;

  std::shared_ptr<Slot> prev;
  {
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    auto& ref = by_id_[id];
    prev = std::move(ref);
    ref = slot;
  }
  res.ok = true;

  RegistryEvent superseded;
  if (prev) {
    std::lock_guard<std::mutex> lk(prev->mu);
    if (!prev->removed) {
      res.replaced_existing = true;
      // Re-registering on the same link must not close it.
      if (prev->conn == conn) prev->conn.reset();
      superseded.kind = RegistryEvent::Kind::Superseded;
      superseded.reason = RemovalReason::Superseded;
      superseded.device = RetireLocked(*prev);
    }
  }

  if (res.replaced_existing) {
    if (logger_) logger_->Log(common::log::Level::Info, "registry", "device superseded: " + id);
    Notify(superseded);
  }
  if (logger_) {
    logger_->Log(common::log::Level::Info, "registry",
                 "device registered: " + id + " peer=" + registered.device.public_ip);
  }
  Notify(registered);
  return res;
}

std::optional<model::DeviceEntity> DeviceRegistry::Lookup(const std::string& id) const {
  const auto slot = FindSlot(id);
  if (!slot) return std::nullopt;
  std::lock_guard<std::mutex> lk(slot->mu);
  if (slot->removed) return std::nullopt;
  return slot->device;
}

bool DeviceRegistry::Has(const std::string& id) const { return Lookup(id).has_value(); }

bool DeviceRegistry::Touch(const std::string& id, std::int64_t unix_ms,
                           common::time::SteadyTime at, const transport::Connection* via) {
  const auto slot = FindSlot(id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lk(slot->mu);
  if (slot->removed) return false;
  if (via != nullptr && slot->conn.get() != via) return false;
  auto& st = slot->device.status;
  st.last_seen_ms = std::max(st.last_seen_ms, unix_ms);
  st.last_activity = std::max(st.last_activity, at);
  return true;
}

bool DeviceRegistry::Remove(const std::string& id, RemovalReason reason) {
  return RemoveIfBound(id, nullptr, reason);
}

bool DeviceRegistry::RemoveIfBound(const std::string& id, const transport::Connection* conn,
                                   RemovalReason reason) {
  const auto slot = FindSlot(id);
  if (!slot) return false;

  RegistryEvent ev;
  ev.kind = RegistryEvent::Kind::Disconnected;
  ev.reason = reason;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->removed) return false;
    if (conn != nullptr && slot->conn.get() != conn) return false;
    ev.device = RetireLocked(*slot);
  }
  EraseIfCurrent(id, slot);

  if (logger_) {
    logger_->Log(common::log::Level::Info, "registry",
                 "device disconnected: " + id + " reason=" + ToString(reason));
  }
  Notify(ev);
  return true;
}

bool DeviceRegistry::EvictIfIdle(const std::string& id, common::time::SteadyTime now,
                                 std::chrono::milliseconds timeout) {
  const auto slot = FindSlot(id);
  if (!slot) return false;

  RegistryEvent ev;
  ev.kind = RegistryEvent::Kind::Disconnected;
  ev.reason = RemovalReason::HeartbeatTimeout;
  std::int64_t idle_ms = 0;
  {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->removed) return false;
    if (now - slot->device.status.last_activity <= timeout) return false;
    idle_ms = common::time::ElapsedMs(slot->device.status.last_activity, now);
    ev.device = RetireLocked(*slot);
  }
  EraseIfCurrent(id, slot);

  if (logger_) {
    logger_->Log(common::log::Level::Warn, "registry",
                 "device timed out: " + id + " idle_ms=" + std::to_string(idle_ms));
  }
  Notify(ev);
  return true;
}

std::vector<std::string> DeviceRegistry::IdleDeviceIds(common::time::SteadyTime now,
                                                       std::chrono::milliseconds timeout) const {
  std::vector<std::string> out;
  for (const auto& slot : AllSlots()) {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (slot->removed) continue;
    if (now - slot->device.status.last_activity > timeout) out.push_back(slot->device.id);
  }
  return out;
}

bool DeviceRegistry::WithDevice(const std::string& id, const Mutator& fn) {
  const auto slot = FindSlot(id);
  if (!slot) return false;
  std::lock_guard<std::mutex> lk(slot->mu);
  if (slot->removed || !slot->conn) return false;
  fn(slot->device, *slot->conn);
  return true;
}

common::error::Status DeviceRegistry::ReplaceCapabilities(const std::string& id,
                                                          std::vector<model::Capability> caps) {
  using common::error::ErrorCode;
  using common::error::Status;

  std::set<std::string> seen;
  for (const auto& c : caps) {
    if (c.id.empty()) return Status::Failure(ErrorCode::InvalidCommand, "blank capability id");
    if (!seen.insert(c.id).second) {
      return Status::Failure(ErrorCode::InvalidCommand, "duplicate capability id '" + c.id + "'");
    }
  }

  const bool found = WithDevice(id, [&](model::DeviceEntity& d, transport::Connection&) {
    for (auto& c : caps) {
      const model::Capability* prior = d.FindCapability(c.id);
      if (prior != nullptr && c.config.empty()) c.config = prior->config;
    }
    d.capabilities = std::move(caps);
  });
  if (!found) return Status::Failure(ErrorCode::DeviceNotConnected, "device " + id + " not connected");

  if (logger_) {
    logger_->Log(common::log::Level::Info, "registry",
                 "device " + id + " capabilities replaced count=" + std::to_string(seen.size()));
  }
  return Status::Success();
}

std::vector<model::DeviceEntity> DeviceRegistry::List() const {
  std::vector<model::DeviceEntity> out;
  for (const auto& slot : AllSlots()) {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (!slot->removed) out.push_back(slot->device);
  }
  std::sort(out.begin(), out.end(), [](const model::DeviceEntity& a, const model::DeviceEntity& b) {
    return a.id < b.id;
  });
  return out;
}

std::size_t DeviceRegistry::Size() const {
  std::shared_lock<std::shared_mutex> lk(map_mu_);
  return by_id_.size();
}

std::size_t DeviceRegistry::CountInState(model::DeviceState state) const {
  std::size_t n = 0;
  for (const auto& slot : AllSlots()) {
    std::lock_guard<std::mutex> lk(slot->mu);
    if (!slot->removed && slot->device.status.state == state) ++n;
  }
  return n;
}

std::size_t DeviceRegistry::Drain(RemovalReason reason) {
  std::unordered_map<std::string, std::shared_ptr<Slot>> drained;
  {
    std::unique_lock<std::shared_mutex> lk(map_mu_);
    drained.swap(by_id_);
  }

  std::size_t n = 0;
  for (const auto& kv : drained) {
    RegistryEvent ev;
    ev.kind = RegistryEvent::Kind::Disconnected;
    ev.reason = reason;
    {
      std::lock_guard<std::mutex> lk(kv.second->mu);
      if (kv.second->removed) continue;
      ev.device = RetireLocked(*kv.second);
    }
    ++n;
    Notify(ev);
  }
  if (logger_ && n > 0) {
    logger_->Log(common::log::Level::Info, "registry",
                 "drained " + std::to_string(n) + " device(s) reason=" + ToString(reason));
  }
  return n;
}

std::string DeviceRegistry::DeviceToJson(const model::DeviceEntity& d) {
  std::vector<std::string> caps;
  caps.reserve(d.capabilities.size());
  for (const auto& c : d.capabilities) {
    std::vector<std::pair<std::string, std::string>> fields = {
        {"id", json::Quote(c.id)},
        {"label", json::Quote(c.label)},
        {"configurable", json::Bool(c.configurable)},
    };
    if (!c.config.empty()) fields.emplace_back("config", c.config);
    caps.push_back(json::Object(fields));
  }

  const bool online = d.status.state != model::DeviceState::Disconnected;
  return json::Object({
      {"deviceId", json::Quote(d.id)},
      {"name", json::Quote(d.name)},
      {"firmwareVersion", json::Quote(d.firmware_version)},
      {"capabilities", json::Array(caps)},
      {"publicIp", json::Quote(d.public_ip)},
      {"connectedAt", json::Quote(common::time::FormatIso8601Utc(d.status.connected_at_ms))},
      {"lastSeen", json::Quote(common::time::FormatIso8601Utc(d.status.last_seen_ms))},
      {"status", json::Quote(online ? "online" : "offline")},
      {"state", json::Quote(model::ToString(d.status.state))},
      {"activeSessionId", d.active_session_id.empty() ? "null" : json::Quote(d.active_session_id)},
      {"samplingRate", json::Number(d.sampling_rate)},
      {"cameraResolution", json::Quote(d.camera_resolution)},
      {"compressionEnabled", json::Bool(d.compression_enabled)},
      {"otaEnabled", json::Bool(d.ota_enabled)},
  });
}

std::string DeviceRegistry::ToJsonList() const {
  std::vector<std::string> items;
  for (const auto& d : List()) items.push_back(DeviceToJson(d));
  return json::Array(items);
}

bool DeviceRegistry::ToJsonOne(const std::string& id, std::string& out_json) const {
  const auto d = Lookup(id);
  if (!d) return false;
  out_json = DeviceToJson(*d);
  return true;
}

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devgw
