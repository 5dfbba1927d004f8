#include "core/common/config/config_manager.hpp"
#include "core/common/config/gateway_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace devgw::core::common::config {

static std::string MissingKeyMessage(std::string_view key) {
  return std::string("missing config key: ") + std::string(key);
}

static std::string BadValueMessage(std::string_view key, std::string_view value) {
  return std::string("invalid value for ") + std::string(key) + ": '" + std::string(value) + "'";
}

std::vector<std::string> ValidateRequiredKeys(const ConfigManager& cfg,
                                             const std::vector<std::string>& required_keys) {
  std::vector<std::string> errors;
  errors.reserve(required_keys.size());
  for (const auto& k : required_keys) {
    if (!cfg.Has(k)) errors.push_back(MissingKeyMessage(k));
  }
  return errors;
}

namespace {

void ReadString(const ConfigManager& cfg, const char* key, std::string& out) {
  std::string v;
  if (cfg.GetString(key, v) && !v.empty()) out = v;
}

void ReadInt(const ConfigManager& cfg, const char* key, std::int64_t& out,
             std::vector<std::string>& errors) {
  if (!cfg.Has(key)) return;
  std::int64_t v = 0;
  if (cfg.GetInt64(key, v)) {
    out = v;
  } else {
    errors.push_back(BadValueMessage(key, cfg.GetStringOr(key, "")));
  }
}

void ReadBool(const ConfigManager& cfg, const char* key, bool& out,
              std::vector<std::string>& errors) {
  if (!cfg.Has(key)) return;
  bool v = false;
  if (cfg.GetBool(key, v)) {
    out = v;
  } else {
    errors.push_back(BadValueMessage(key, cfg.GetStringOr(key, "")));
  }
}

bool IsPath(const std::string& p) { return !p.empty() && p.front() == '/'; }

}  // namespace

std::vector<std::string> LoadGatewayConfig(const ConfigManager& cfg, GatewayConfig& out) {
  std::vector<std::string> errors;

  ReadString(cfg, "log.file", out.log_file);
  ReadString(cfg, "log.level", out.log_level);
  ReadBool(cfg, "log.console", out.log_console, errors);

  ReadString(cfg, "http.listen", out.http_listen);
  ReadString(cfg, "http.api_base", out.api_base);
  ReadString(cfg, "http.device_ws_path", out.device_ws_path);
  ReadString(cfg, "http.monitor_ws_path", out.monitor_ws_path);

  ReadString(cfg, "transport.tcp_listen", out.tcp_listen);
  ReadInt(cfg, "transport.max_frame_bytes", out.max_frame_bytes, errors);

  ReadInt(cfg, "heartbeat.interval_ms", out.heartbeat_interval_ms, errors);
  ReadInt(cfg, "heartbeat.timeout_ms", out.heartbeat_timeout_ms, errors);
  ReadInt(cfg, "heartbeat.sweep_interval_ms", out.sweep_interval_ms, errors);

  ReadString(cfg, "storage.measurements_file", out.measurements_file);
  return errors;
}

std::vector<std::string> ValidateGatewayConfig(const GatewayConfig& cfg,
                                               std::vector<std::string>* warnings) {
  std::vector<std::string> errors;

  if (cfg.http_listen.empty()) errors.push_back("http.listen must not be empty");
  if (!IsPath(cfg.device_ws_path)) errors.push_back("http.device_ws_path must start with '/'");
  if (!IsPath(cfg.monitor_ws_path)) errors.push_back("http.monitor_ws_path must start with '/'");
  if (cfg.device_ws_path == cfg.monitor_ws_path) {
    errors.push_back("http.device_ws_path and http.monitor_ws_path must differ");
  }
  if (cfg.max_frame_bytes < 256) errors.push_back("transport.max_frame_bytes must be >= 256");

  if (cfg.heartbeat_interval_ms <= 0) errors.push_back("heartbeat.interval_ms must be > 0");
  if (cfg.sweep_interval_ms <= 0) errors.push_back("heartbeat.sweep_interval_ms must be > 0");
  if (cfg.heartbeat_timeout_ms <= cfg.heartbeat_interval_ms) {
    errors.push_back("heartbeat.timeout_ms must exceed heartbeat.interval_ms");
  } else if (warnings != nullptr && cfg.heartbeat_timeout_ms < 2 * cfg.heartbeat_interval_ms) {
    warnings->push_back("heartbeat.timeout_ms is less than twice heartbeat.interval_ms; "
                        "a single late heartbeat will evict the device");
  }
  if (warnings != nullptr && cfg.sweep_interval_ms > cfg.heartbeat_timeout_ms) {
    warnings->push_back("heartbeat.sweep_interval_ms exceeds heartbeat.timeout_ms");
  }

  return errors;
}

}  // namespace devgw::core::common::config
