#ifndef CONDUIT_CLIENT_HTTP_CLIENT_H
#define CONDUIT_CLIENT_HTTP_CLIENT_H

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include "conduit/config/client_config.h"
#include "conduit/core/single.h"
#include "conduit/event/event_loop.h"
#include "conduit/event/worker_pool.h"
#include "conduit/http/connection_driver.h"
#include "conduit/http/http_client_operations.h"
#include "conduit/http/http_client_request.h"
#include "conduit/http/http_client_response.h"
#include "conduit/http/uri.h"
#include "conduit/network/connector.h"
#include "conduit/transport/ssl_context.h"

namespace conduit {
namespace client {

/**
 * @brief Entry point for issuing HTTP and WebSocket requests.
 *
 * Owns a pool of worker dispatchers; every request is pinned to one of
 * them, round-robin. Requests are lazy: nothing connects until the
 * returned Single is subscribed, and each subscription is a new request.
 *
 * Example:
 *   HttpClient client(config);
 *   client.get("http://example.com/")
 *       .flatMap([](http::HttpClientResponsePtr r) {
 *         return http::receiveString(*r);
 *       })
 *       .subscribe([](Result<std::string> body) { ... });
 */
class HttpClient {
 public:
  // Validates config; throws ConfigValidationError
  explicit HttpClient(const config::ClientConfig& config);

  // Test seam: requests go through connector, no workers are started
  HttpClient(const config::ClientConfig& config,
             network::ConnectorSharedPtr connector);

  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  Single<http::HttpClientResponsePtr> get(
      const std::string& url, http::RequestHandler handler = nullptr);
  Single<http::HttpClientResponsePtr> post(
      const std::string& url, http::RequestHandler handler = nullptr);
  Single<http::HttpClientResponsePtr> put(
      const std::string& url, http::RequestHandler handler = nullptr);
  Single<http::HttpClientResponsePtr> remove(
      const std::string& url, http::RequestHandler handler = nullptr);

  Single<http::HttpClientResponsePtr> request(http::HttpMethod method,
                                              const std::string& url,
                                              http::RequestHandler handler);

  /**
   * WebSocket request. The Single yields the handshake response once the
   * upgrade succeeded; handler then runs the session.
   */
  Single<http::HttpClientResponsePtr> ws(const std::string& url,
                                         http::WebSocketHandler handler,
                                         const std::string& sub_protocols = "");

  /**
   * WebSocket session. Completes when handler's completion does; fails
   * with HandlerError if handler throws, and with the upgrade's failure
   * (ConnectionClosed on a drop) if the connection ends first.
   */
  Completion websocket(const std::string& url, http::WebSocketHandler handler);

  const config::ClientConfig& config() const { return config_; }
  const http::ExchangeOptions& exchangeOptions() const { return options_; }

  // Absolute URLs pass through; others are resolved against host and port
  Result<http::Uri> resolveUrl(const std::string& url) const;

 private:
  void initialize();
  network::ConnectorSharedPtr nextConnector();
  // resolveUrl with the scheme switched to ws or wss
  Result<http::Uri> resolveWebSocketUrl(const std::string& url) const;

  const config::ClientConfig config_;
  http::ExchangeOptions options_;
  std::unique_ptr<event::DispatcherFactory> dispatcher_factory_;
  std::unique_ptr<event::WorkerPool> workers_;
  std::vector<network::ConnectorSharedPtr> connectors_;
  std::atomic<size_t> next_connector_{0};
};

}  // namespace client
}  // namespace conduit

#endif  // CONDUIT_CLIENT_HTTP_CLIENT_H
