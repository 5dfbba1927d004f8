#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>

#include "core/common/logger/logger.hpp"

namespace devgw::core::storage {

struct Measurement {
  std::string device_id;
  std::int64_t timestamp_ms = 0;
  std::string session_id;
  std::string sensor;
  // Raw JSON as received from the device.
  std::string payload;
};

// Hand-off point to the ingestion path. Called from the transport thread;
// implementations must be quick and thread-safe.
class MeasurementSink {
public:
  virtual ~MeasurementSink() = default;
  virtual bool Store(const Measurement& m) = 0;
};

class LogMeasurementSink final : public MeasurementSink {
public:
  explicit LogMeasurementSink(std::shared_ptr<common::log::Logger> logger);

  bool Store(const Measurement& m) override;

private:
  std::shared_ptr<common::log::Logger> logger_;
};

// One JSON object per line, appended.
class JsonLinesMeasurementSink final : public MeasurementSink {
public:
  explicit JsonLinesMeasurementSink(std::filesystem::path file_path,
                                    std::shared_ptr<common::log::Logger> logger = nullptr);

  bool Store(const Measurement& m) override;
  bool IsOpen() const;

  static std::string ToJson(const Measurement& m);

private:
  mutable std::mutex mu_;
  std::filesystem::path file_path_;
  std::ofstream ofs_;
  std::shared_ptr<common::log::Logger> logger_;
};

}  // namespace devgw::core::storage
