#ifndef CONDUIT_NETWORK_CONNECTOR_H
#define CONDUIT_NETWORK_CONNECTOR_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "conduit/core/disposable.h"
#include "conduit/core/result.h"
#include "conduit/network/channel.h"
#include "conduit/network/channel_impl.h"
#include "conduit/network/dns_resolver.h"
#include "conduit/network/socket_options.h"
#include "conduit/transport/ssl_context.h"

namespace conduit {
namespace event {
class Dispatcher;
}

namespace network {

struct ConnectRequest {
  std::string host;
  uint16_t port{0};
  bool secure{false};
};

using ConnectCallback = std::function<void(Result<ChannelSharedPtr>)>;

/**
 * Opens client channels.
 */
class Connector {
 public:
  virtual ~Connector() = default;

  /**
   * Establish a channel to request.host:request.port.
   * The callback runs once, on the new channel's dispatcher thread.
   * Disposing the handle abandons the attempt; the callback is then
   * never invoked.
   */
  virtual DisposablePtr connect(const ConnectRequest& request,
                                ConnectCallback callback) = 0;
};

using ConnectorSharedPtr = std::shared_ptr<Connector>;

struct TcpConnectorConfig {
  SocketOptions socket_options;
  ChannelOptions channel_options;
  // Bounds resolution, TCP connect and TLS handshake together
  std::chrono::milliseconds connect_timeout{30000};
  std::chrono::milliseconds ssl_handshake_timeout{10000};
  // Required for secure requests
  transport::SslContextSharedPtr ssl_context;
};

/**
 * Connector over non-blocking TCP sockets on one dispatcher. Tries each
 * resolved address in turn until one accepts the TCP connection.
 */
class TcpConnector : public Connector,
                     public std::enable_shared_from_this<TcpConnector> {
 public:
  TcpConnector(event::Dispatcher& dispatcher, TcpConnectorConfig config);

  DisposablePtr connect(const ConnectRequest& request,
                        ConnectCallback callback) override;

  event::Dispatcher& dispatcher() { return dispatcher_; }

 private:
  class ConnectAttempt;
  friend class ConnectAttempt;

  DnsResolver& resolver();

  event::Dispatcher& dispatcher_;
  const TcpConnectorConfig config_;
  DnsResolverSharedPtr resolver_;
};

}  // namespace network
}  // namespace conduit

#endif  // CONDUIT_NETWORK_CONNECTOR_H
