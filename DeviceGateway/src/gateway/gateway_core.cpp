#include "gateway/gateway_core.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>
#include <vector>

#include "core/common/config/config_manager.hpp"
#include "core/common/config/gateway_config.hpp"
#include "core/common/logger/logger.hpp"
#include "core/control/capture_session_service.hpp"
#include "core/device/dispatch/command_dispatcher.hpp"
#include "core/device/heartbeat/heartbeat_monitor.hpp"
#include "core/device/manager/device_registry.hpp"
#include "core/device/session/session_controller.hpp"
#include "core/storage/measurement_sink.hpp"
#include "services/web_services/api/rest_api.hpp"
#include "services/web_services/websocket/websocket_server.hpp"

#ifndef DEVGW_VERSION
#define DEVGW_VERSION "0.0.0-dev"
#endif

namespace devgw {
namespace gateway {

namespace cfgns = devgw::core::common::config;
namespace lg = devgw::core::common::log;
namespace web = devgw::services::web_services;

std::atomic<bool>& GatewayCore::RunningFlag() {
  static std::atomic<bool> running{true};
  return running;
}

void GatewayCore::HandleSignal(int) {
  RunningFlag().store(false);
}

void GatewayCore::RequestStop() {
  RunningFlag().store(false);
}

const char* GatewayCore::Version() {
  return DEVGW_VERSION;
}

int GatewayCore::Run(const Args& args) {
  if (args.print_version) {
    std::cout << Version() << "\n";
    return 0;
  }

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  cfgns::ConfigManager cfg;
  if (!args.config_yaml.empty() && !cfg.LoadYamlFile(args.config_yaml)) {
    std::cerr << "failed to load config " << args.config_yaml << ": " << cfg.LastError() << "\n";
    return 2;
  }

  cfgns::GatewayConfig gc;
  for (const auto& e : cfgns::LoadGatewayConfig(cfg, gc)) std::cerr << "config: " << e << "\n";
  if (args.log_file) gc.log_file = *args.log_file;
  if (args.log_level) gc.log_level = *args.log_level;
  if (args.listen) gc.http_listen = *args.listen;

  std::vector<std::string> warnings;
  const auto errors = cfgns::ValidateGatewayConfig(gc, &warnings);
  if (!errors.empty()) {
    for (const auto& e : errors) std::cerr << "config error: " << e << "\n";
    return 2;
  }

  std::error_code ec;
  const std::filesystem::path log_path(gc.log_file);
  if (!log_path.parent_path().empty()) std::filesystem::create_directories(log_path.parent_path(), ec);

  std::vector<std::shared_ptr<lg::Sink>> sinks;
  sinks.push_back(std::make_shared<lg::FileSink>(log_path));
  if (gc.log_console) sinks.push_back(std::make_shared<lg::ConsoleSink>());
  auto logger = std::make_shared<lg::Logger>(std::make_shared<lg::TeeSink>(std::move(sinks)));

  lg::Level lvl{};
  if (lg::ParseLevel(gc.log_level, lvl)) {
    logger->SetLevel(lvl);
  } else {
    logger->Warn("unknown log level '" + gc.log_level + "', using info");
  }

  logger->Info(std::string("devgw ") + Version() + " starting");
  logger->Info("log_file=" + gc.log_file);
  for (const auto& w : warnings) logger->Warn("config: " + w);

  std::shared_ptr<devgw::core::storage::MeasurementSink> measurements;
  if (!gc.measurements_file.empty()) {
    auto file_sink =
        std::make_shared<devgw::core::storage::JsonLinesMeasurementSink>(gc.measurements_file, logger);
    if (!file_sink->IsOpen()) {
      logger->Error("cannot open measurements file " + gc.measurements_file);
      return 2;
    }
    measurements = file_sink;
  } else {
    measurements = std::make_shared<devgw::core::storage::LogMeasurementSink>(logger);
  }

  devgw::core::device::manager::DeviceRegistry registry(logger);
  devgw::core::device::session::SessionController controller(registry, measurements, logger);
  devgw::core::device::dispatch::CommandDispatcher dispatcher(registry, logger);
  devgw::core::control::CaptureSessionService sessions(dispatcher, logger);

  web::websocket::MongooseServer::Options web_opt;
  web_opt.listen_addr = gc.http_listen;
  web_opt.device_ws_path = gc.device_ws_path;
  web_opt.monitor_ws_path = gc.monitor_ws_path;
  web_opt.tcp_listen = gc.tcp_listen;
  web_opt.max_frame_bytes = static_cast<std::size_t>(gc.max_frame_bytes);
  web::websocket::MongooseServer server(web_opt, controller, registry, logger);

  registry.AddObserver([&server](const devgw::core::device::manager::RegistryEvent& ev) {
    server.PublishRegistryEvent(ev);
  });

  web::api::ApiContext api;
  api.base_path = gc.api_base;
  api.version = Version();
  api.device_registry = &registry;
  api.dispatcher = &dispatcher;
  api.sessions = &sessions;
  api.monitor_clients = [&server]() { return server.MonitorCount(); };
  api.logger = logger;
  server.SetApiContext(std::move(api));

  if (!server.Start()) {
    logger->Fatal("failed to start listeners");
    logger->Flush();
    return 1;
  }

  devgw::core::device::heartbeat::HeartbeatMonitor::Options hb;
  hb.timeout = std::chrono::milliseconds(gc.heartbeat_timeout_ms);
  hb.sweep_interval = std::chrono::milliseconds(gc.sweep_interval_ms);
  devgw::core::device::heartbeat::HeartbeatMonitor monitor(registry, hb, logger);
  (void)monitor.Start();

  while (RunningFlag().load()) {
    server.Poll(50);
  }

  logger->Info("devgw stopping");
  monitor.Stop();
  const std::size_t drained = registry.Drain(devgw::core::device::manager::RemovalReason::Shutdown);
  // Flush the close frames queued by the drain.
  server.Poll(50);
  server.Shutdown();
  logger->Info("closed " + std::to_string(drained) + " device link(s)");
  logger->Flush();
  return 0;
}

}  // namespace gateway
}  // namespace devgw
