#include "services/web_services/websocket/websocket_server.hpp"

#include <cstring>
#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "core/common/utils/json_utils.hpp"

namespace devgw::services::web_services::websocket {

namespace json = devgw::core::common::json;
using core::common::log::Level;
using core::device::manager::RegistryEvent;

namespace {

// Role tag kept in mg_connection::data[0].
constexpr char kDeviceWs = 'D';
constexpr char kMonitorWs = 'M';
constexpr char kLine = 'L';

// Set in mg_connection::data[1] while the rest of an oversize line is skipped.
constexpr char kDiscarding = 1;

static std::string PeerOf(struct mg_connection* c) {
  char buf[64] = {0};
  mg_snprintf(buf, sizeof(buf), "%M", mg_print_ip_port, &c->rem);
  return std::string(buf);
}

static std::map<unsigned long, struct mg_connection*> ConnsById(struct mg_mgr* mgr) {
  std::map<unsigned long, struct mg_connection*> out;
  for (struct mg_connection* c = mgr->conns; c != nullptr; c = c->next) out[c->id] = c;
  return out;
}

}  // namespace

MongooseServer::MongooseServer(Options opt, core::device::session::SessionController& controller,
                               core::device::manager::DeviceRegistry& registry,
                               std::shared_ptr<core::common::log::Logger> logger)
    : opt_(std::move(opt)), controller_(controller), registry_(registry), logger_(std::move(logger)) {
  mg_mgr_init(&mgr_);
  outbox_ = std::make_shared<Outbox>(&mgr_);
}

MongooseServer::~MongooseServer() {
  Shutdown();
  mg_mgr_free(&mgr_);
}

bool MongooseServer::Start() {
  if (!mg_wakeup_init(&mgr_)) {
    if (logger_) logger_->Error("Failed to initialise mongoose wakeup pipe");
    return false;
  }

  struct mg_connection* http = mg_http_listen(&mgr_, opt_.listen_addr.c_str(), EventHandler, this);
  if (http == nullptr) {
    if (logger_) logger_->Error("Failed to listen on " + opt_.listen_addr);
    return false;
  }
  outbox_->SetWakeTarget(http->id);
  if (logger_) {
    logger_->Info("Mongoose listening on " + opt_.listen_addr + " devices=" + opt_.device_ws_path +
                  " monitor=" + opt_.monitor_ws_path);
  }

  if (!opt_.tcp_listen.empty()) {
    if (mg_listen(&mgr_, opt_.tcp_listen.c_str(), LineEventHandler, this) == nullptr) {
      if (logger_) logger_->Error("Failed to listen on " + opt_.tcp_listen);
      return false;
    }
    if (logger_) logger_->Info("Line transport listening on " + opt_.tcp_listen);
  }
  return true;
}

void MongooseServer::Poll(int timeout_ms) {
  mg_mgr_poll(&mgr_, timeout_ms);
}

void MongooseServer::Shutdown() {
  outbox_->Shutdown();
}

void MongooseServer::PublishRegistryEvent(const RegistryEvent& ev) {
  OutboundFrame f;
  f.op = OutboundFrame::Op::Broadcast;
  f.data = RegistryEventToJson(ev);
  (void)outbox_->Push(std::move(f));
}

std::string MongooseServer::RegistryEventToJson(const RegistryEvent& ev) {
  using Kind = RegistryEvent::Kind;
  switch (ev.kind) {
    case Kind::Registered:
      return json::Object({
          {"type", json::Quote("device_registered")},
          {"device", core::device::manager::DeviceRegistry::DeviceToJson(ev.device)},
      });
    case Kind::Superseded:
      return json::Object({
          {"type", json::Quote("device_superseded")},
          {"deviceId", json::Quote(ev.device.id)},
      });
    case Kind::Disconnected:
    default:
      return json::Object({
          {"type", json::Quote("device_disconnected")},
          {"deviceId", json::Quote(ev.device.id)},
          {"reason", json::Quote(core::device::manager::ToString(ev.reason))},
      });
  }
}

void MongooseServer::EventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* self = static_cast<MongooseServer*>(c->fn_data);
  self->HandleEvent(c, ev, ev_data);
}

void MongooseServer::LineEventHandler(struct mg_connection* c, int ev, void* ev_data) {
  auto* self = static_cast<MongooseServer*>(c->fn_data);
  self->HandleLineEvent(c, ev, ev_data);
}

void MongooseServer::HandleEvent(struct mg_connection* c, int ev, void* ev_data) {
  if (ev == MG_EV_HTTP_MSG) {
    struct mg_http_message* hm = (struct mg_http_message*)ev_data;

    if (mg_match(hm->uri, mg_str(opt_.device_ws_path.c_str()), NULL)) {
      c->data[0] = kDeviceWs;
      mg_ws_upgrade(c, hm, nullptr);
    } else if (mg_match(hm->uri, mg_str(opt_.monitor_ws_path.c_str()), NULL)) {
      c->data[0] = kMonitorWs;
      mg_ws_upgrade(c, hm, nullptr);
    } else if (has_api_ && api::HandleHttpRequest(c, hm, api_ctx_)) {
      // handled
    } else {
      api::ReplyError(c, 404, "not_found", std::string(hm->uri.buf, hm->uri.len));
    }
  } else if (ev == MG_EV_WS_OPEN) {
    if (c->data[0] == kDeviceWs) {
      (void)OpenLink(c, LinkKind::WebSocket);
    } else if (c->data[0] == kMonitorWs) {
      monitors_.insert(c->id);
      monitor_count_.store(monitors_.size());
      if (logger_) logger_->Log(Level::Info, "monitor", "client connected " + PeerOf(c));
      SendDevicesList(c);
    }
  } else if (ev == MG_EV_WS_MSG) {
    struct mg_ws_message* wm = (struct mg_ws_message*)ev_data;
    if (c->data[0] != kDeviceWs) return;
    const int op = wm->flags & 0x0F;
    if (op != WEBSOCKET_OP_TEXT && op != WEBSOCKET_OP_BINARY) return;
    DeliverFrame(c, wm->data.buf, wm->data.len);
  } else if (ev == MG_EV_WAKEUP) {
    FlushOutbox();
  } else if (ev == MG_EV_CLOSE) {
    if (c->data[0] == kDeviceWs) {
      CloseLink(c);
    } else if (c->data[0] == kMonitorWs) {
      monitors_.erase(c->id);
      monitor_count_.store(monitors_.size());
      if (logger_) logger_->Log(Level::Info, "monitor", "client disconnected " + PeerOf(c));
    }
  }
}

void MongooseServer::HandleLineEvent(struct mg_connection* c, int ev, void* ev_data) {
  (void)ev_data;
  if (ev == MG_EV_ACCEPT) {
    c->data[0] = kLine;
    (void)OpenLink(c, LinkKind::Line);
  } else if (ev == MG_EV_READ) {
    ReadLines(c);
  } else if (ev == MG_EV_CLOSE) {
    if (c->data[0] == kLine) CloseLink(c);
  }
}

std::shared_ptr<MongooseConnection> MongooseServer::OpenLink(struct mg_connection* c, LinkKind kind) {
  auto link = std::make_shared<MongooseConnection>(outbox_, c->id, kind, PeerOf(c));
  links_[c->id] = link;
  link_count_.store(links_.size());
  controller_.OnOpen(link);
  return link;
}

void MongooseServer::CloseLink(struct mg_connection* c) {
  const auto it = links_.find(c->id);
  if (it == links_.end()) return;
  std::shared_ptr<MongooseConnection> link = std::move(it->second);
  links_.erase(it);
  link_count_.store(links_.size());
  link->MarkClosed();
  controller_.OnClose(link);
}

void MongooseServer::DeliverFrame(struct mg_connection* c, const char* data, std::size_t len) {
  const auto it = links_.find(c->id);
  if (it == links_.end()) return;
  std::shared_ptr<MongooseConnection> link = it->second;
  if (len > opt_.max_frame_bytes) {
    controller_.RejectFrame(link, "frame_too_large: " + std::to_string(len) + " bytes exceeds " +
                                      std::to_string(opt_.max_frame_bytes));
    return;
  }
  controller_.OnFrame(link, std::string_view(data, len));
}

void MongooseServer::ReadLines(struct mg_connection* c) {
  struct mg_iobuf* io = &c->recv;
  std::size_t start = 0;
  if (c->data[1] == kDiscarding) {
    const void* nl = std::memchr(io->buf, '\n', io->len);
    if (nl == nullptr) {
      mg_iobuf_del(io, 0, io->len);
      return;
    }
    start = static_cast<std::size_t>(static_cast<const unsigned char*>(nl) - io->buf) + 1;
    c->data[1] = 0;
  }
  for (std::size_t i = start; i < io->len; ++i) {
    if (io->buf[i] != '\n') continue;
    std::size_t end = i;
    if (end > start && io->buf[end - 1] == '\r') --end;
    if (end > start) DeliverFrame(c, reinterpret_cast<const char*>(io->buf) + start, end - start);
    start = i + 1;
    // A frame may have closed the link; stop reading from it.
    if (c->is_closing || c->is_draining) break;
  }
  if (start > 0) mg_iobuf_del(io, 0, start);
  if (c->is_closing || c->is_draining) return;

  // Partial line that can never become a valid frame: drop it along with
  // whatever arrives before its newline.
  if (io->len > opt_.max_frame_bytes) {
    const std::size_t dropped = io->len;
    mg_iobuf_del(io, 0, io->len);
    c->data[1] = kDiscarding;
    const auto it = links_.find(c->id);
    if (it != links_.end()) {
      controller_.RejectFrame(it->second, "frame_too_large: unterminated line of " +
                                              std::to_string(dropped) + " bytes");
    }
  }
}

void MongooseServer::SendDevicesList(struct mg_connection* c) {
  const std::string body = json::Object({
      {"type", json::Quote("devices_list")},
      {"devices", registry_.ToJsonList()},
  });
  mg_ws_send(c, body.data(), body.size(), WEBSOCKET_OP_TEXT);
}

void MongooseServer::FlushOutbox() {
  std::deque<OutboundFrame> frames = outbox_->TakeAll();
  if (frames.empty()) return;
  const auto conns = ConnsById(&mgr_);

  for (const auto& f : frames) {
    if (f.op == OutboundFrame::Op::Broadcast) {
      for (unsigned long id : monitors_) {
        const auto it = conns.find(id);
        if (it == conns.end() || it->second->is_draining) continue;
        mg_ws_send(it->second, f.data.data(), f.data.size(), WEBSOCKET_OP_TEXT);
      }
      continue;
    }

    const auto it = conns.find(f.conn_id);
    if (it == conns.end()) continue;
    struct mg_connection* c = it->second;
    if (c->is_draining || c->is_closing) continue;

    const bool line = c->data[0] == kLine;
    if (f.op == OutboundFrame::Op::Text) {
      if (line) {
        mg_send(c, f.data.data(), f.data.size());
        mg_send(c, "\n", 1);
      } else {
        mg_ws_send(c, f.data.data(), f.data.size(), WEBSOCKET_OP_TEXT);
      }
    } else {
      if (!line) mg_ws_send(c, "", 0, WEBSOCKET_OP_CLOSE);
      c->is_draining = 1;
    }
  }
}

}  // namespace devgw::services::web_services::websocket
