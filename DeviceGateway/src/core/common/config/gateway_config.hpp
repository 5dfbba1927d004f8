#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "core/common/config/config_manager.hpp"

namespace devgw::core::common::config {

struct GatewayConfig {
  std::string log_file = "logs/devgw.log";
  std::string log_level = "info";
  bool log_console = true;

  std::string http_listen = "http://0.0.0.0:8080";
  std::string api_base = "/api";
  std::string device_ws_path = "/ws/esp32";
  std::string monitor_ws_path = "/ws/devices";

  // Newline-delimited JSON listener; empty disables it.
  std::string tcp_listen;
  std::int64_t max_frame_bytes = 64 * 1024;

  // Nominal device heartbeat period; the reference firmware beats every 5 s.
  std::int64_t heartbeat_interval_ms = 5000;
  std::int64_t heartbeat_timeout_ms = 15000;
  std::int64_t sweep_interval_ms = 500;

  // Empty keeps measurements in the log only.
  std::string measurements_file;
};

// Overlays values present in `cfg` onto `out`. Keys that are present but
// unparsable are reported in the returned list and leave the default intact.
std::vector<std::string> LoadGatewayConfig(const ConfigManager& cfg, GatewayConfig& out);

// Errors make the configuration unusable; warnings are returned separately.
std::vector<std::string> ValidateGatewayConfig(const GatewayConfig& cfg,
                                               std::vector<std::string>* warnings = nullptr);

}  // namespace devgw::core::common::config
