#include "services/web_services/websocket/mongoose_connection.hpp"

#include <utility>

namespace devgw::services::web_services::websocket {

void Outbox::SetWakeTarget(unsigned long conn_id) {
  std::lock_guard<std::mutex> lk(mu_);
  wake_id_ = conn_id;
}

bool Outbox::Push(OutboundFrame frame) {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_ || wake_id_ == 0) return false;
  const bool was_empty = queue_.empty();
  queue_.push_back(std::move(frame));
  // One pending wakeup is enough; the loop drains everything queued.
  if (was_empty) {
    static const char kPing = 'w';
    if (!mg_wakeup(mgr_, wake_id_, &kPing, 1)) {
      queue_.pop_back();
      return false;
    }
  }
  return true;
}

std::deque<OutboundFrame> Outbox::TakeAll() {
  std::lock_guard<std::mutex> lk(mu_);
  std::deque<OutboundFrame> out;
  out.swap(queue_);
  return out;
}

void Outbox::Shutdown() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  queue_.clear();
}

bool MongooseConnection::Send(const std::string& frame) {
  if (!open_.load()) return false;
  OutboundFrame f;
  f.op = OutboundFrame::Op::Text;
  f.conn_id = conn_id_;
  f.data = frame;
  return outbox_->Push(std::move(f));
}

void MongooseConnection::Close() {
  if (!open_.exchange(false)) return;
  OutboundFrame f;
  f.op = OutboundFrame::Op::Close;
  f.conn_id = conn_id_;
  (void)outbox_->Push(std::move(f));
}

}  // namespace devgw::services::web_services::websocket
