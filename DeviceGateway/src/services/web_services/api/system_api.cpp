#include "services/web_services/api/rest_api.hpp"

#include <string>

#include "core/common/utils/json_utils.hpp"
#include "core/common/utils/time_utils.hpp"

namespace devgw {
namespace services {
namespace web_services {
namespace api {

namespace json = devgw::core::common::json;
using devgw::core::common::error::ErrorCode;

namespace {

static std::string ToStdString(const struct mg_str& s) {
  return std::string(s.buf, s.len);
}

static std::string NormalizeBasePath(std::string p) {
  if (p.empty()) return std::string("/api");
  if (p[0] != '/') p.insert(p.begin(), '/');
  while (p.size() > 1 && p.back() == '/') p.pop_back();
  return p;
}

static bool StripBasePath(const std::string& uri, const std::string& base_path, std::string& out_rel) {
  if (base_path.empty() || base_path == "/") {
    out_rel = uri;
    return true;
  }
  if (uri == base_path) {
    out_rel = "/";
    return true;
  }
  const std::string prefix = base_path + "/";
  if (uri.size() >= prefix.size() && uri.compare(0, prefix.size(), prefix) == 0) {
    out_rel = uri.substr(base_path.size());
    if (out_rel.empty()) out_rel = "/";
    return true;
  }
  return false;
}

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

}  // namespace

int HttpStatusFor(ErrorCode code) {
  switch (code) {
    case ErrorCode::Ok:                    return 200;
    case ErrorCode::DeviceNotConnected:    return 404;
    case ErrorCode::UnsupportedCapability: return 422;
    case ErrorCode::SessionAlreadyActive:
    case ErrorCode::NoActiveSession:
    case ErrorCode::SessionMismatch:
    case ErrorCode::InvalidState:          return 409;
    case ErrorCode::InvalidCommand:
    case ErrorCode::ProtocolError:         return 400;
    case ErrorCode::SendFailed:            return 503;
    default:                               return 500;
  }
}

void ReplyJson(struct mg_connection* c, int http_status, const std::string& body) {
  mg_http_reply(c, http_status, "Content-Type: application/json\r\n", "%s\n", body.c_str());
}

void ReplyError(struct mg_connection* c, int http_status, const std::string& error,
                const std::string& detail) {
  ReplyJson(c, http_status,
            json::Object({{"error", json::Quote(error)}, {"detail", json::Quote(detail)}}));
}

void ReplyStatus(struct mg_connection* c, const devgw::core::common::error::Status& st) {
  if (st.IsOk()) {
    ReplyJson(c, 200, json::Object({{"success", json::Bool(true)}}));
    return;
  }
  ReplyError(c, HttpStatusFor(st.Code()), devgw::core::common::error::ToString(st.Code()), st.Message());
}

bool HandleHttpRequest(struct mg_connection* c, struct mg_http_message* hm, const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;

  const std::string uri = ToStdString(hm->uri);
  const std::string base_path = NormalizeBasePath(ctx.base_path);

  std::string rel_path;
  if (!StripBasePath(uri, base_path, rel_path)) return false;
  while (rel_path.size() > 1 && rel_path.back() == '/') rel_path.pop_back();

  if (ctx.logger) {
    ctx.logger->Log(devgw::core::common::log::Level::Debug, "http",
                    ToStdString(hm->method) + " " + uri);
  }

  if (HandleSystemApi(c, hm, rel_path, ctx)) return true;
  if (HandleDeviceApi(c, hm, rel_path, ctx)) return true;
  if (HandleSessionApi(c, hm, rel_path, ctx)) return true;

  return false;
}

bool HandleSystemApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx) {
  if (IsMethod(hm, "GET") && rel_path == "/health") {
    const std::size_t devices = ctx.device_registry ? ctx.device_registry->Size() : 0;
    const std::size_t sessions = ctx.sessions ? ctx.sessions->ActiveCount() : 0;
    const std::size_t monitors = ctx.monitor_clients ? ctx.monitor_clients() : 0;
    const std::string body = json::Object({
        {"status", json::Quote("ok")},
        {"timestamp", json::Quote(devgw::core::common::time::NowIso8601Utc())},
        {"connectedDevices", json::Number(devices)},
        {"activeSessions", json::Number(sessions)},
        {"monitorClients", json::Number(monitors)},
    });
    ReplyJson(c, 200, body);
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/version") {
    ReplyJson(c, 200, json::Object({{"version", json::Quote(ctx.version)}}));
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devgw
