#include "core/device/heartbeat/heartbeat_monitor.hpp"

#include <string>
#include <utility>

namespace devgw::core::device::heartbeat {

HeartbeatMonitor::HeartbeatMonitor(manager::DeviceRegistry& registry, Options opt,
                                   std::shared_ptr<common::log::Logger> logger,
                                   common::time::SteadyNowFn now)
    : registry_(registry),
      opt_(opt),
      logger_(std::move(logger)),
      now_(now ? std::move(now) : common::time::SteadyNowFn(&common::time::SteadyNow)) {}

HeartbeatMonitor::~HeartbeatMonitor() { Stop(); }

bool HeartbeatMonitor::Start() {
  std::lock_guard<std::mutex> lk(mu_);
  if (worker_.joinable()) return false;
  stop_requested_ = false;
  worker_ = std::thread(&HeartbeatMonitor::Run, this);
  if (logger_) {
    logger_->Log(common::log::Level::Info, "heartbeat",
                 "monitor started timeout_ms=" + std::to_string(opt_.timeout.count()) +
                     " sweep_ms=" + std::to_string(opt_.sweep_interval.count()));
  }
  return true;
}

void HeartbeatMonitor::Stop() {
  std::thread worker;
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (!worker_.joinable()) return;
    stop_requested_ = true;
    worker = std::move(worker_);
  }
  cv_.notify_all();
  worker.join();
  if (logger_) logger_->Log(common::log::Level::Info, "heartbeat", "monitor stopped");
}

bool HeartbeatMonitor::IsRunning() const {
  std::lock_guard<std::mutex> lk(mu_);
  return worker_.joinable() && !stop_requested_;
}

std::size_t HeartbeatMonitor::SweepOnce() {
  const auto now = now_();
  std::size_t evicted = 0;
  for (const auto& id : registry_.IdleDeviceIds(now, opt_.timeout)) {
    if (registry_.EvictIfIdle(id, now, opt_.timeout)) ++evicted;
  }
  return evicted;
}

void HeartbeatMonitor::Run() {
  std::unique_lock<std::mutex> lk(mu_);
  while (!stop_requested_) {
    if (cv_.wait_for(lk, opt_.sweep_interval, [this] { return stop_requested_; })) break;
    lk.unlock();
    const std::size_t n = SweepOnce();
    if (n > 0 && logger_) {
      logger_->Log(common::log::Level::Debug, "heartbeat", "evicted " + std::to_string(n) + " device(s)");
    }
    lk.lock();
  }
}

}  // namespace devgw::core::device::heartbeat
