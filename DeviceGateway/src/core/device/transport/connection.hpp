#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace devgw::core::device::transport {

// One duplex device link carrying discrete text frames. Implementations must
// allow Send/Close from any thread and must not call back into the gateway
// synchronously from either.
class Connection {
public:
  virtual ~Connection() = default;

  // Queues one frame. Returns false once the link is closed.
  virtual bool Send(const std::string& frame) = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  virtual std::uint64_t Id() const = 0;
  virtual std::string Peer() const = 0;

  // Device bound by a successful register on this link. Touched only by the
  // thread that delivers this connection's frames.
  const std::string& DeviceId() const { return device_id_; }
  void BindDevice(std::string device_id) { device_id_ = std::move(device_id); }
  void UnbindDevice() { device_id_.clear(); }

private:
  std::string device_id_;
};

}  // namespace devgw::core::device::transport
