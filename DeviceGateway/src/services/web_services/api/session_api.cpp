#include "services/web_services/api/rest_api.hpp"

#include <string>

#include "core/common/utils/json_utils.hpp"

namespace devgw {
namespace services {
namespace web_services {
namespace api {

namespace json = devgw::core::common::json;
namespace control = devgw::core::control;

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

static bool ParseCreateRequest(const std::string& body, control::CaptureSessionRequest& out,
                               std::string& error) {
  if (!json::IsObject(body)) {
    error = "body must be a JSON object";
    return false;
  }
  if (!json::GetStringArray(body, "$.nodes", out.nodes)) {
    error = "nodes must be an array of device ids";
    return false;
  }
  if (json::KindAt(body, "$.sensors") != json::Kind::Missing &&
      !json::GetStringArray(body, "$.sensors", out.sensors)) {
    error = "sensors must be an array of strings";
    return false;
  }
  if (json::KindAt(body, "$.duration") != json::Kind::Missing &&
      (!json::GetInt64(body, "$.duration", out.duration_s) || out.duration_s < 0)) {
    error = "duration must be a non-negative integer";
    return false;
  }
  out.name = json::GetStringOr(body, "$.name", std::string());
  out.retention_policy = json::GetStringOr(body, "$.retentionPolicy", std::string());
  return true;
}

static std::string Wrap(const std::string& session_json) {
  return json::Object({{"success", json::Bool(true)}, {"session", session_json}});
}

}  // namespace

bool HandleSessionApi(struct mg_connection* c, struct mg_http_message* hm, const std::string& rel_path,
                      const ApiContext& ctx) {
  if (c == nullptr || hm == nullptr) return false;
  if (rel_path != "/sessions" && !StartsWith(rel_path, "/sessions/")) return false;
  if (ctx.sessions == nullptr) {
    ReplyError(c, 500, "session_service_null");
    return true;
  }

  if (rel_path == "/sessions") {
    if (IsMethod(hm, "GET")) {
      ReplyJson(c, 200, json::Object({{"sessions", ctx.sessions->ToJsonList()}}));
      return true;
    }
    if (IsMethod(hm, "POST")) {
      control::CaptureSessionRequest req;
      std::string error;
      if (!ParseCreateRequest(ToStdString(hm->body), req, error)) {
        ReplyError(c, 400, "invalid_command", error);
        return true;
      }
      control::CaptureSession session;
      const auto st = ctx.sessions->Create(req, session);
      if (!st.IsOk()) {
        ReplyStatus(c, st);
        return true;
      }
      ReplyJson(c, 201, Wrap(control::CaptureSessionService::ToJson(session)));
      return true;
    }
    return false;
  }

  std::string id = rel_path.substr(std::string("/sessions/").size());
  std::string action;
  const std::size_t slash = id.find('/');
  if (slash != std::string::npos) {
    action = id.substr(slash + 1);
    id.resize(slash);
  }
  if (id.empty()) return false;

  if ((action == "start" || action == "stop") && IsMethod(hm, "POST")) {
    control::CaptureSession session;
    const bool found = action == "start" ? ctx.sessions->Start(id, session)
                                         : ctx.sessions->Stop(id, session);
    if (!found) {
      ReplyError(c, 404, "session_not_found", id);
      return true;
    }
    ReplyJson(c, 200, Wrap(control::CaptureSessionService::ToJson(session)));
    return true;
  }

  if (action.empty() && IsMethod(hm, "GET")) {
    const auto session = ctx.sessions->Get(id);
    if (!session) {
      ReplyError(c, 404, "session_not_found", id);
      return true;
    }
    ReplyJson(c, 200, json::Object({{"session", control::CaptureSessionService::ToJson(*session)}}));
    return true;
  }

  return false;
}

}  // namespace api
}  // namespace web_services
}  // namespace services
}  // namespace devgw
