#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/device/manager/device_registry.hpp"
#include "core/device/protocol/message.hpp"

namespace devgw::core::device::dispatch {

// Pushes commands to connected devices. Each send validates the command
// against the device state machine, writes the frame and commits the new
// state while holding that device's lock, so commands to one device go out
// in the order they were submitted and commands to different devices never
// wait on each other. Delivery is at-most-once: nothing is queued for
// devices that are not connected and nothing is retried.
class CommandDispatcher {
public:
  explicit CommandDispatcher(manager::DeviceRegistry& registry,
                             std::shared_ptr<common::log::Logger> logger = nullptr);

  // A session_start without a session id is given a fresh one.
  common::error::Status Send(const std::string& device_id, const protocol::Command& cmd);

  std::uint64_t SentCount() const { return sent_.load(); }
  std::uint64_t FailedCount() const { return failed_.load(); }

private:
  manager::DeviceRegistry& registry_;
  std::shared_ptr<common::log::Logger> logger_;
  std::atomic<std::uint64_t> sent_{0};
  std::atomic<std::uint64_t> failed_{0};
};

}  // namespace devgw::core::device::dispatch
