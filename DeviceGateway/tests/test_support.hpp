#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "core/common/logger/logger.hpp"
#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"
#include "core/device/transport/connection.hpp"
#include "core/storage/measurement_sink.hpp"

namespace devgw::test {

// In-memory link. Optionally holds every Send() until Release() so tests can
// park a dispatcher inside one device's lock.
class FakeConnection : public core::device::transport::Connection {
public:
  explicit FakeConnection(std::string peer = "10.0.0.7:50000")
      : id_(NextId()), peer_(std::move(peer)) {}

  bool Send(const std::string& frame) override {
    std::unique_lock<std::mutex> lk(mu_);
    if (gated_) {
      ++waiting_;
      cv_.notify_all();
      cv_.wait(lk, [this] { return !gated_; });
      --waiting_;
    }
    if (!open_ || fail_sends_) return false;
    frames_.push_back(frame);
    cv_.notify_all();
    return true;
  }

  void Close() override {
    std::lock_guard<std::mutex> lk(mu_);
    if (open_) ++close_calls_;
    open_ = false;
  }

  bool IsOpen() const override {
    std::lock_guard<std::mutex> lk(mu_);
    return open_;
  }

  std::uint64_t Id() const override { return id_; }
  std::string Peer() const override { return peer_; }

  std::vector<std::string> Frames() const {
    std::lock_guard<std::mutex> lk(mu_);
    return frames_;
  }

  std::string LastFrame() const {
    std::lock_guard<std::mutex> lk(mu_);
    return frames_.empty() ? std::string() : frames_.back();
  }

  std::size_t FrameCount() const {
    std::lock_guard<std::mutex> lk(mu_);
    return frames_.size();
  }

  int CloseCalls() const {
    std::lock_guard<std::mutex> lk(mu_);
    return close_calls_;
  }

  void SetFailSends(bool fail) {
    std::lock_guard<std::mutex> lk(mu_);
    fail_sends_ = fail;
  }

  void Gate() {
    std::lock_guard<std::mutex> lk(mu_);
    gated_ = true;
  }

  void Release() {
    std::lock_guard<std::mutex> lk(mu_);
    gated_ = false;
    cv_.notify_all();
  }

  // Blocks until a sender is parked on the gate.
  bool WaitForBlockedSender(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lk(mu_);
    return cv_.wait_for(lk, timeout, [this] { return waiting_ > 0; });
  }

private:
  static std::uint64_t NextId() {
    static std::atomic<std::uint64_t> next{1};
    return next.fetch_add(1);
  }

  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::uint64_t id_;
  std::string peer_;
  std::vector<std::string> frames_;
  bool open_ = true;
  bool fail_sends_ = false;
  bool gated_ = false;
  int waiting_ = 0;
  int close_calls_ = 0;
};

class ManualClock {
public:
  ManualClock() : now_(core::common::time::SteadyTime{} + std::chrono::hours(1)) {}

  core::common::time::SteadyTime Now() const {
    std::lock_guard<std::mutex> lk(mu_);
    return now_;
  }

  void Advance(std::chrono::milliseconds d) {
    std::lock_guard<std::mutex> lk(mu_);
    now_ += d;
  }

  core::common::time::SteadyNowFn Fn() {
    return [this] { return Now(); };
  }

private:
  mutable std::mutex mu_;
  core::common::time::SteadyTime now_;
};

class MemoryMeasurementSink : public core::storage::MeasurementSink {
public:
  bool Store(const core::storage::Measurement& m) override {
    std::lock_guard<std::mutex> lk(mu_);
    items_.push_back(m);
    return true;
  }

  std::vector<core::storage::Measurement> Items() const {
    std::lock_guard<std::mutex> lk(mu_);
    return items_;
  }

private:
  mutable std::mutex mu_;
  std::vector<core::storage::Measurement> items_;
};

class MemoryLogSink : public core::common::log::Sink {
public:
  void Write(const core::common::log::Event& e) override {
    std::lock_guard<std::mutex> lk(mu_);
    lines_.push_back(core::common::log::FormatLine(e));
  }

  std::vector<std::string> Lines() const {
    std::lock_guard<std::mutex> lk(mu_);
    return lines_;
  }

private:
  mutable std::mutex mu_;
  std::vector<std::string> lines_;
};

// Same shape as the reference ESP32 firmware's register frame.
inline std::string RegisterFrame(const std::string& device_id) {
  namespace json = core::common::json;
  const std::vector<std::string> caps = {
      json::Object({{"id", json::Quote("camera")}, {"label", json::Quote("Camera Module")},
                    {"configurable", "true"}}),
      json::Object({{"id", json::Quote("microphone")}, {"label", json::Quote("Microphone")},
                    {"configurable", "true"}}),
      json::Object({{"id", json::Quote("pzem004t")}, {"label", json::Quote("PZEM-004T Power Sensor")},
                    {"configurable", "false"}}),
      json::Object({{"id", json::Quote("sd")}, {"label", json::Quote("SD Card Storage")},
                    {"configurable", "true"}}),
  };
  return json::Object({
      {"type", json::Quote("register")},
      {"deviceId", json::Quote(device_id)},
      {"name", json::Quote("ESP32 Test Node")},
      {"firmwareVersion", json::Quote("1.0.0")},
      {"capabilities", json::Array(caps)},
      {"samplingRate", "500"},
      {"cameraResolution", json::Quote("640x480")},
      {"compressionEnabled", "true"},
      {"otaEnabled", "true"},
  });
}

inline std::string FieldOf(const std::string& frame, const char* path) {
  return core::common::json::GetStringOr(frame, path, std::string());
}

}  // namespace devgw::test
