/**
 * @file ssl_transport_socket.h
 * @brief TLS client transport over a non-blocking socket
 */

#ifndef CONDUIT_TRANSPORT_SSL_TRANSPORT_SOCKET_H
#define CONDUIT_TRANSPORT_SSL_TRANSPORT_SOCKET_H

#include <chrono>
#include <string>

#include "conduit/event/event_loop.h"
#include "conduit/network/transport_socket.h"
#include "conduit/transport/ssl_context.h"

namespace conduit {
namespace transport {

/**
 * TLS client transport.
 *
 * The handshake starts in onConnected() and is driven by whichever of
 * doRead()/doWrite() the channel calls next. Connected is raised once it
 * completes; a failure or timeout closes the channel with the reason in
 * failureReason().
 */
class SslTransportSocket : public network::TransportSocket {
 public:
  SslTransportSocket(SslContextSharedPtr context,
                     std::string server_name,
                     std::chrono::milliseconds handshake_timeout);
  ~SslTransportSocket() override;

  void setTransportSocketCallbacks(
      network::TransportSocketCallbacks& callbacks) override;
  std::string protocol() const override;
  std::string failureReason() const override { return failure_reason_; }
  bool secure() const override { return true; }
  void onConnected() override;
  network::IoResult doRead(Buffer& buffer) override;
  network::IoResult doWrite(Buffer& buffer) override;
  void closeSocket(network::ChannelEvent event) override;

 private:
  enum class HandshakeStatus { Complete, InProgress, Failed };

  HandshakeStatus doHandshake();
  void onHandshakeTimeout();
  std::string sslErrorReason(int ret);

  SslContextSharedPtr context_;
  const std::string server_name_;
  const std::chrono::milliseconds handshake_timeout_;
  network::TransportSocketCallbacks* callbacks_{nullptr};
  SSL* ssl_{nullptr};
  event::TimerPtr handshake_timer_;
  bool handshake_complete_{false};
  bool shutdown_sent_{false};
  std::string failure_reason_;
};

}  // namespace transport
}  // namespace conduit

#endif  // CONDUIT_TRANSPORT_SSL_TRANSPORT_SOCKET_H
