#include "core/storage/measurement_sink.hpp"

#include <utility>

#include "core/common/utils/json_utils.hpp"

namespace devgw::core::storage {

namespace json = devgw::core::common::json;

LogMeasurementSink::LogMeasurementSink(std::shared_ptr<common::log::Logger> logger)
    : logger_(std::move(logger)) {}

bool LogMeasurementSink::Store(const Measurement& m) {
  if (!logger_) return false;
  logger_->Log(common::log::Level::Debug, "measurement",
               m.device_id + " ts=" + std::to_string(m.timestamp_ms) + " sensor=" + m.sensor +
                   " bytes=" + std::to_string(m.payload.size()));
  return true;
}

JsonLinesMeasurementSink::JsonLinesMeasurementSink(std::filesystem::path file_path,
                                                   std::shared_ptr<common::log::Logger> logger)
    : file_path_(std::move(file_path)),
      ofs_(file_path_, std::ios::out | std::ios::app),
      logger_(std::move(logger)) {
  if (!ofs_ && logger_) logger_->Error("cannot open measurements file " + file_path_.string());
}

bool JsonLinesMeasurementSink::IsOpen() const {
  std::lock_guard<std::mutex> lk(mu_);
  return ofs_.is_open();
}

std::string JsonLinesMeasurementSink::ToJson(const Measurement& m) {
  bool raw_ok = false;
  if (!m.payload.empty()) {
    const json::Kind k = json::KindAt(m.payload, "$");
    raw_ok = k != json::Kind::Invalid && k != json::Kind::Missing;
  }
  return json::Object({
      {"deviceId", json::Quote(m.device_id)},
      {"timestamp", json::Number(m.timestamp_ms)},
      {"sessionId", m.session_id.empty() ? "null" : json::Quote(m.session_id)},
      {"sensor", json::Quote(m.sensor)},
      {"measurement", raw_ok ? m.payload : json::Quote(m.payload)},
  });
}

bool JsonLinesMeasurementSink::Store(const Measurement& m) {
  const std::string line = ToJson(m);
  std::lock_guard<std::mutex> lk(mu_);
  if (!ofs_) return false;
  ofs_ << line << '\n';
  ofs_.flush();
  return static_cast<bool>(ofs_);
}

}  // namespace devgw::core::storage
