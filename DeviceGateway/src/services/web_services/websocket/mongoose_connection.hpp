#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>

#include "mongoose.h"
#include "core/device/transport/connection.hpp"

namespace devgw::services::web_services::websocket {

enum class LinkKind : std::uint8_t { WebSocket, Line };

struct OutboundFrame {
  enum class Op : std::uint8_t { Text, Close, Broadcast };

  Op op = Op::Text;
  unsigned long conn_id = 0;
  std::string data;
};

// Frames written from any thread and flushed by the event loop. Only the loop
// thread touches sockets; producers queue here and poke the loop with
// mg_wakeup.
class Outbox {
public:
  explicit Outbox(struct mg_mgr* mgr) : mgr_(mgr) {}

  // Connection that receives MG_EV_WAKEUP. Until set, Push() fails.
  void SetWakeTarget(unsigned long conn_id);

  bool Push(OutboundFrame frame);
  std::deque<OutboundFrame> TakeAll();

  // After this, Push() fails and the manager is never touched again.
  void Shutdown();

private:
  struct mg_mgr* mgr_;
  std::mutex mu_;
  std::deque<OutboundFrame> queue_;
  unsigned long wake_id_ = 0;
  bool closed_ = false;
};

class MongooseConnection : public core::device::transport::Connection {
public:
  MongooseConnection(std::shared_ptr<Outbox> outbox, unsigned long conn_id, LinkKind kind,
                     std::string peer)
      : outbox_(std::move(outbox)), conn_id_(conn_id), kind_(kind), peer_(std::move(peer)) {}

  bool Send(const std::string& frame) override;
  void Close() override;
  bool IsOpen() const override { return open_.load(); }

  std::uint64_t Id() const override { return conn_id_; }
  std::string Peer() const override { return peer_; }

  LinkKind Kind() const { return kind_; }

  // Loop thread, on MG_EV_CLOSE.
  void MarkClosed() { open_.store(false); }

private:
  std::shared_ptr<Outbox> outbox_;
  unsigned long conn_id_;
  LinkKind kind_;
  std::string peer_;
  std::atomic<bool> open_{true};
};

}  // namespace devgw::services::web_services::websocket
