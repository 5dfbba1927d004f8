#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/model/device_entity.hpp"
#include "core/device/transport/connection.hpp"

namespace devgw {
namespace core {
namespace device {
namespace manager {

enum class RemovalReason : std::uint8_t {
  ConnectionClosed,
  HeartbeatTimeout,
  Superseded,
  Shutdown,
  Explicit
};

const char* ToString(RemovalReason r);

struct RegistryEvent {
  enum class Kind : std::uint8_t { Registered, Superseded, Disconnected };

  Kind kind = Kind::Registered;
  // Snapshot taken when the event happened. For Superseded and Disconnected
  // the state is already DeviceState::Disconnected.
  model::DeviceEntity device;
  RemovalReason reason = RemovalReason::Explicit;
};

struct RegisterResult {
  bool ok = false;
  bool replaced_existing = false;
};

// Owns every live device record. The id -> slot map is guarded by a
// reader/writer lock; each record has its own mutex, so work on one device
// never waits for another. Observers run with no registry lock held.
class DeviceRegistry {
public:
  using Observer = std::function<void(const RegistryEvent&)>;
  using Mutator = std::function<void(model::DeviceEntity&, transport::Connection&)>;

  explicit DeviceRegistry(std::shared_ptr<common::log::Logger> logger = nullptr);

  DeviceRegistry(const DeviceRegistry&) = delete;
  DeviceRegistry& operator=(const DeviceRegistry&) = delete;

  // Not synchronized with event delivery; add observers before traffic starts.
  void AddObserver(Observer observer);

  // The newest registration for an id always wins: a prior record is marked
  // Disconnected, its connection closed (unless `conn` is that same link) and
  // a Superseded event emitted. The new record starts in Registered.
  RegisterResult Register(model::DeviceEntity device, std::shared_ptr<transport::Connection> conn);

  std::optional<model::DeviceEntity> Lookup(const std::string& id) const;
  bool Has(const std::string& id) const;

  // lastSeen only moves forward; stale timestamps are ignored. With `via`
  // set, only touches the record if it is still bound to that link.
  bool Touch(const std::string& id, std::int64_t unix_ms, common::time::SteadyTime at,
             const transport::Connection* via = nullptr);

  bool Remove(const std::string& id, RemovalReason reason);

  // Removes `id` only while it is still bound to `conn`; a superseded link
  // closing late must not evict its successor.
  bool RemoveIfBound(const std::string& id, const transport::Connection* conn,
                     RemovalReason reason);

  // Re-checks idleness under the device lock before evicting.
  bool EvictIfIdle(const std::string& id, common::time::SteadyTime now,
                   std::chrono::milliseconds timeout);

  std::vector<std::string> IdleDeviceIds(common::time::SteadyTime now,
                                         std::chrono::milliseconds timeout) const;

  // Runs `fn` on the live record under its lock. Returns false (without
  // calling `fn`) when the device is absent.
  bool WithDevice(const std::string& id, const Mutator& fn);

  // Swaps in a new capability list under the device lock. Ids must be
  // unique (InvalidCommand); a capability that keeps its id keeps its stored
  // config. DeviceNotConnected when the device is absent.
  common::error::Status ReplaceCapabilities(const std::string& id,
                                            std::vector<model::Capability> caps);

  std::vector<model::DeviceEntity> List() const;
  std::size_t Size() const;
  std::size_t CountInState(model::DeviceState state) const;

  // Closes and removes every device; returns how many were removed.
  std::size_t Drain(RemovalReason reason);

  std::string ToJsonList() const;
  bool ToJsonOne(const std::string& id, std::string& out_json) const;
  static std::string DeviceToJson(const model::DeviceEntity& d);

private:
  struct Slot {
    std::mutex mu;
    model::DeviceEntity device;
    std::shared_ptr<transport::Connection> conn;
    bool removed = false;
  };

  std::shared_ptr<Slot> FindSlot(const std::string& id) const;
  std::vector<std::shared_ptr<Slot>> AllSlots() const;

  // Caller holds slot->mu. Marks the record Disconnected and closes its link.
  static model::DeviceEntity RetireLocked(Slot& slot);

  void EraseIfCurrent(const std::string& id, const std::shared_ptr<Slot>& slot);
  void Notify(const RegistryEvent& ev) const;

private:
  std::shared_ptr<common::log::Logger> logger_;
  std::vector<Observer> observers_;

  mutable std::shared_mutex map_mu_;
  std::unordered_map<std::string, std::shared_ptr<Slot>> by_id_;
};

}  // namespace manager
}  // namespace device
}  // namespace core
}  // namespace devgw
