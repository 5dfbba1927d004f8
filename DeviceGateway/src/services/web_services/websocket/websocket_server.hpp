#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <utility>

#include "mongoose.h"
#include "core/common/logger/logger.hpp"
#include "core/device/manager/device_registry.hpp"
#include "core/device/session/session_controller.hpp"
#include "services/web_services/api/rest_api.hpp"
#include "services/web_services/websocket/mongoose_connection.hpp"

namespace devgw::services::web_services::websocket {

// Owns the mongoose manager. One HTTP listener serves the REST API, the
// device WebSocket path and the monitor WebSocket path; an optional raw TCP
// listener carries newline-delimited device frames. All socket work happens
// on the thread that calls Poll().
class MongooseServer {
public:
  struct Options {
    std::string listen_addr = "http://0.0.0.0:8080";
    std::string device_ws_path = "/ws/esp32";
    std::string monitor_ws_path = "/ws/devices";
    std::string tcp_listen;
    std::size_t max_frame_bytes = 65536;
  };

  MongooseServer(Options opt, core::device::session::SessionController& controller,
                 core::device::manager::DeviceRegistry& registry,
                 std::shared_ptr<core::common::log::Logger> logger);
  ~MongooseServer();

  MongooseServer(const MongooseServer&) = delete;
  MongooseServer& operator=(const MongooseServer&) = delete;

  // REST routes are served only once a context is installed.
  void SetApiContext(api::ApiContext ctx) {
    api_ctx_ = std::move(ctx);
    has_api_ = true;
  }

  bool Start();
  void Poll(int timeout_ms);

  // Stops accepting cross-thread frames. Call after the final Poll().
  void Shutdown();

  std::size_t MonitorCount() const { return monitor_count_.load(); }
  std::size_t LinkCount() const { return link_count_.load(); }

  // Any thread. Forwards a registry event to every monitor client.
  void PublishRegistryEvent(const core::device::manager::RegistryEvent& ev);

  static std::string RegistryEventToJson(const core::device::manager::RegistryEvent& ev);

private:
  static void EventHandler(struct mg_connection* c, int ev, void* ev_data);
  static void LineEventHandler(struct mg_connection* c, int ev, void* ev_data);

  void HandleEvent(struct mg_connection* c, int ev, void* ev_data);
  void HandleLineEvent(struct mg_connection* c, int ev, void* ev_data);

  std::shared_ptr<MongooseConnection> OpenLink(struct mg_connection* c, LinkKind kind);
  void CloseLink(struct mg_connection* c);
  void ReadLines(struct mg_connection* c);
  void DeliverFrame(struct mg_connection* c, const char* data, std::size_t len);
  void SendDevicesList(struct mg_connection* c);
  void FlushOutbox();

private:
  Options opt_;
  core::device::session::SessionController& controller_;
  core::device::manager::DeviceRegistry& registry_;
  std::shared_ptr<core::common::log::Logger> logger_;
  api::ApiContext api_ctx_;
  bool has_api_ = false;

  struct mg_mgr mgr_;
  std::shared_ptr<Outbox> outbox_;

  std::unordered_map<unsigned long, std::shared_ptr<MongooseConnection>> links_;
  std::unordered_set<unsigned long> monitors_;
  std::atomic<std::size_t> monitor_count_{0};
  std::atomic<std::size_t> link_count_{0};
};

}  // namespace devgw::services::web_services::websocket
