#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <thread>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/manager/device_registry.hpp"

namespace devgw::core::device::heartbeat {

// Evicts devices that have been silent for longer than the timeout. A single
// worker sweeps the registry every `sweep_interval`; each eviction locks only
// the device concerned, so detection latency per device is bounded by
// timeout + sweep_interval regardless of what other devices are doing.
class HeartbeatMonitor {
public:
  struct Options {
    std::chrono::milliseconds timeout{15000};
    std::chrono::milliseconds sweep_interval{500};
  };

  HeartbeatMonitor(manager::DeviceRegistry& registry, Options opt,
                   std::shared_ptr<common::log::Logger> logger = nullptr,
                   common::time::SteadyNowFn now = nullptr);
  ~HeartbeatMonitor();

  HeartbeatMonitor(const HeartbeatMonitor&) = delete;
  HeartbeatMonitor& operator=(const HeartbeatMonitor&) = delete;

  bool Start();
  // Wakes the worker and joins it. Safe to call more than once.
  void Stop();
  bool IsRunning() const;

  // One pass over the registry at the current time; returns evictions.
  std::size_t SweepOnce();

private:
  void Run();

private:
  manager::DeviceRegistry& registry_;
  Options opt_;
  std::shared_ptr<common::log::Logger> logger_;
  common::time::SteadyNowFn now_;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool stop_requested_ = false;
  std::thread worker_;
};

}  // namespace devgw::core::device::heartbeat
