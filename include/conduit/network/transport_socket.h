#ifndef CONDUIT_NETWORK_TRANSPORT_SOCKET_H
#define CONDUIT_NETWORK_TRANSPORT_SOCKET_H

#include <cstdint>
#include <memory>
#include <string>

#include "conduit/buffer.h"
#include "conduit/core/compat.h"
#include "conduit/core/result.h"

namespace conduit {
namespace event {
class Dispatcher;
}

namespace network {

/**
 * Post-I/O action to take after transport socket operations
 */
enum class PostIoAction {
  KeepOpen,  // Keep the channel open
  Close      // Close the channel
};

/**
 * Result of transport socket I/O operations
 */
struct IoResult {
  PostIoAction action_;
  uint64_t bytes_processed_;
  bool end_stream_read_;

  static IoResult success(uint64_t bytes_processed = 0) {
    return IoResult{PostIoAction::KeepOpen, bytes_processed, false};
  }

  static IoResult endStream(uint64_t bytes_processed) {
    return IoResult{PostIoAction::KeepOpen, bytes_processed, true};
  }

  static IoResult close(uint64_t bytes_processed = 0) {
    return IoResult{PostIoAction::Close, bytes_processed, false};
  }
};

/**
 * Channel lifecycle events raised by the transport
 */
enum class ChannelEvent {
  RemoteClose,
  LocalClose,
  // Transport is ready for application data (after TLS handshake if any)
  Connected
};

class TransportSocketCallbacks {
 public:
  virtual ~TransportSocketCallbacks() = default;

  virtual int fd() const = 0;

  virtual event::Dispatcher& dispatcher() = 0;

  virtual void raiseEvent(ChannelEvent event) = 0;

  // Ask for one write-ready notification even with nothing buffered
  virtual void requestWriteReady() = 0;
};

/**
 * Byte transport under a channel: plain TCP or TLS.
 */
class TransportSocket {
 public:
  virtual ~TransportSocket() = default;

  virtual void setTransportSocketCallbacks(
      TransportSocketCallbacks& callbacks) = 0;

  virtual std::string protocol() const = 0;

  // Why the transport closed, empty if it did not fail
  virtual std::string failureReason() const = 0;

  virtual bool secure() const { return false; }

  // The TCP connection is established
  virtual void onConnected() = 0;

  // Read everything currently available into buffer
  virtual IoResult doRead(Buffer& buffer) = 0;

  // Write as much of buffer as the socket accepts, draining what was sent
  virtual IoResult doWrite(Buffer& buffer) = 0;

  virtual void closeSocket(ChannelEvent event) = 0;
};

using TransportSocketPtr = std::unique_ptr<TransportSocket>;

/**
 * Plain TCP transport
 */
class RawTransportSocket : public TransportSocket {
 public:
  void setTransportSocketCallbacks(TransportSocketCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }
  std::string protocol() const override { return "tcp"; }
  std::string failureReason() const override { return failure_reason_; }
  void onConnected() override;
  IoResult doRead(Buffer& buffer) override;
  IoResult doWrite(Buffer& buffer) override;
  void closeSocket(ChannelEvent) override {}

 private:
  TransportSocketCallbacks* callbacks_{nullptr};
  std::string failure_reason_;
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_TRANSPORT_SOCKET_H
