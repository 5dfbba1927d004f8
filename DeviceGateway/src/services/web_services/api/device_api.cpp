#include "services/web_services/api/rest_api.hpp"

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/common/utils/id_utils.hpp"
#include "core/common/utils/json_utils.hpp"

namespace devgw {
namespace services {
namespace web_services {
namespace api {

namespace json = devgw::core::common::json;
namespace protocol = devgw::core::device::protocol;

namespace {

static std::string ToStdString(const struct mg_str& s) {
  return std::string(s.buf, s.len);
}

static bool IsMethod(const struct mg_http_message* hm, const char* method) {
  return mg_strcmp(hm->method, mg_str(method)) == 0;
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool EndsWith(const std::string& s, const std::string& suffix) {
  return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// "/devices/<id><tail>" -> id, or empty when the path does not match.
static std::string DeviceIdFor(const std::string& rel_path, const std::string& tail) {
  const std::string base = "/devices/";
  if (!StartsWith(rel_path, base) || !EndsWith(rel_path, tail)) return std::string();
  if (rel_path.size() <= base.size() + tail.size()) return std::string();
  const std::string id = rel_path.substr(base.size(), rel_path.size() - base.size() - tail.size());
  if (id.find('/') != std::string::npos) return std::string();
  return id;
}

// Empty bodies count as "{}".
static bool ReadBody(const struct mg_http_message* hm, std::string& out) {
  out = ToStdString(hm->body);
  if (out.find_first_not_of(" \t\r\n") == std::string::npos) {
    out = "{}";
    return true;
  }
  return json::IsObject(out);
}

static void ReplyDispatch(struct mg_connection* c, const devgw::core::common::error::Status& st,
                          const std::string& device_id, const std::string& session_id) {
  if (!st.IsOk()) {
    ReplyStatus(c, st);
    return;
  }
  std::vector<std::pair<std::string, std::string>> fields = {
      {"success", json::Bool(true)},
      {"deviceId", json::Quote(device_id)},
  };
  if (!session_id.empty()) fields.emplace_back("sessionId", json::Quote(session_id));
  ReplyJson(c, 200, json::Object(fields));
}

static void HandleConfigure(struct mg_connection* c, struct mg_http_message* hm,
                            const std::string& id, const ApiContext& ctx) {
  std::string body;
  std::string config;
  if (!ReadBody(hm, body) || !json::GetRaw(body, "$.config", config) || !json::IsObject(config)) {
    ReplyError(c, 400, "invalid_command", "body must be {\"config\":{...}}");
    return;
  }

  protocol::ConfigUpdateMessage cmd;
  (void)json::ForEach(config, [&](std::string_view key, std::string_view value) {
    cmd.config.emplace_back(std::string(key), std::string(value));
  });
  ReplyDispatch(c, ctx.dispatcher->Send(id, cmd), id, std::string());
}

static void HandleSessionStart(struct mg_connection* c, struct mg_http_message* hm,
                               const std::string& id, const ApiContext& ctx) {
  std::string body;
  if (!ReadBody(hm, body)) {
    ReplyError(c, 400, "invalid_command", "body must be a JSON object");
    return;
  }

  protocol::SessionStartMessage cmd;
  cmd.session_id = json::GetStringOr(body, "$.sessionId", std::string());
  cmd.session_token = json::GetStringOr(body, "$.sessionToken", std::string());
  if (json::KindAt(body, "$.sensors") != json::Kind::Missing &&
      !json::GetStringArray(body, "$.sensors", cmd.sensors)) {
    ReplyError(c, 400, "invalid_command", "sensors must be an array of strings");
    return;
  }
  if (json::KindAt(body, "$.duration") != json::Kind::Missing &&
      (!json::GetInt64(body, "$.duration", cmd.duration_s) || cmd.duration_s < 0)) {
    ReplyError(c, 400, "invalid_command", "duration must be a non-negative integer");
    return;
  }
  if (cmd.session_id.empty()) cmd.session_id = devgw::core::common::id::NewUuid();

  ReplyDispatch(c, ctx.dispatcher->Send(id, cmd), id, cmd.session_id);
}

static void HandleSessionStop(struct mg_connection* c, struct mg_http_message* hm,
                              const std::string& id, const ApiContext& ctx) {
  std::string body;
  if (!ReadBody(hm, body)) {
    ReplyError(c, 400, "invalid_command", "body must be a JSON object");
    return;
  }

  protocol::SessionStopMessage cmd;
  cmd.session_id = json::GetStringOr(body, "$.sessionId", std::string());
  ReplyDispatch(c, ctx.dispatcher->Send(id, cmd), id, cmd.session_id);
}

static void HandleCapabilities(struct mg_connection* c, struct mg_http_message* hm,
                               const std::string& id, const ApiContext& ctx) {
  std::string body;
  std::vector<devgw::core::device::model::Capability> caps;
  std::string error;
  if (!ReadBody(hm, body) || json::KindAt(body, "$.capabilities") != json::Kind::Array) {
    ReplyError(c, 400, "invalid_command", "body must be {\"capabilities\":[...]}");
    return;
  }
  if (!protocol::DecodeCapabilities(body, caps, error)) {
    ReplyError(c, 400, "invalid_command", error);
    return;
  }
  ReplyDispatch(c, ctx.device_registry->ReplaceCapabilities(id, std::move(caps)), id, std::string());
}

}  // namespace

bool HandleDeviceApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                     const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;
  if (rel_path != "/devices" && !StartsWith(rel_path, "/devices/")) return false;
  if (ctx.device_registry == nullptr || ctx.dispatcher == nullptr) {
    ReplyError(c, 500, "device_registry_null");
    return true;
  }

  if (IsMethod(hm, "GET") && rel_path == "/devices") {
    ReplyJson(c, 200, ctx.device_registry->ToJsonList());
    return true;
  }

  std::string id = DeviceIdFor(rel_path, "/configure");
  if (!id.empty()) {
    if (!IsMethod(hm, "PUT")) return false;
    HandleConfigure(c, hm, id, ctx);
    return true;
  }

  id = DeviceIdFor(rel_path, "/capabilities");
  if (!id.empty()) {
    if (!IsMethod(hm, "PUT")) return false;
    HandleCapabilities(c, hm, id, ctx);
    return true;
  }

  id = DeviceIdFor(rel_path, "/session/start");
  if (!id.empty()) {
    if (!IsMethod(hm, "POST")) return false;
    HandleSessionStart(c, hm, id, ctx);
    return true;
  }

  id = DeviceIdFor(rel_path, "/session/stop");
  if (!id.empty()) {
    if (!IsMethod(hm, "POST")) return false;
    HandleSessionStop(c, hm, id, ctx);
    return true;
  }

  id = DeviceIdFor(rel_path, "");
  if (!id.empty() && IsMethod(hm, "GET")) {
    std::string body;
    if (ctx.device_registry->ToJsonOne(id, body)) {
      ReplyJson(c, 200, body);
    } else {
      ReplyError(c, 404, "device_not_connected", id);
    }
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devgw
