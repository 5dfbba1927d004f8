#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <string>

#include "mongoose.h"

#include "core/common/error/error.hpp"
#include "core/common/logger/logger.hpp"
#include "core/control/capture_session_service.hpp"
#include "core/device/dispatch/command_dispatcher.hpp"
#include "core/device/manager/device_registry.hpp"

namespace devgw {
namespace services {
namespace web_services {
namespace api {

struct ApiContext {
    std::string base_path = "/api";
    std::string version;

    devgw::core::device::manager::DeviceRegistry* device_registry = nullptr;
    devgw::core::device::dispatch::CommandDispatcher* dispatcher = nullptr;
    devgw::core::control::CaptureSessionService* sessions = nullptr;

    // Number of connected monitor WebSocket clients, owned by the server.
    std::function<std::size_t()> monitor_clients;

    std::shared_ptr<devgw::core::common::log::Logger> logger;
};

bool HandleHttpRequest(struct mg_connection* c, struct mg_http_message* hm, const ApiContext& ctx);

bool HandleSystemApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx);

bool HandleSessionApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                      const ApiContext& ctx);

int HttpStatusFor(devgw::core::common::error::ErrorCode code);

void ReplyJson(struct mg_connection* c, int http_status, const std::string& body);
void ReplyError(struct mg_connection* c, int http_status, const std::string& error,
                const std::string& detail = std::string());
void ReplyStatus(struct mg_connection* c, const devgw::core::common::error::Status& st);

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devgw
