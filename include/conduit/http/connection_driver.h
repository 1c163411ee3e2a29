#ifndef CONDUIT_HTTP_CONNECTION_DRIVER_H
#define CONDUIT_HTTP_CONNECTION_DRIVER_H

#include <memory>

#include "conduit/core/single.h"
#include "conduit/http/http_client_operations.h"
#include "conduit/http/http_client_request.h"
#include "conduit/http/http_client_response.h"
#include "conduit/http/redirect_history.h"
#include "conduit/http/uri.h"
#include "conduit/network/connector.h"

namespace conduit {
namespace http {

/**
 * Turns a target into one exchange on a fresh connection.
 *
 * Each subscription to the Single returned by acquire() opens a new
 * channel, installs the HTTP pipeline (http_codec, reactive_bridge) and
 * an HttpClientOperations owning it, then runs the request handler.
 * The Single terminates exactly once. Connect failures of any kind are
 * reported as ConnectFailure.
 */
class ConnectionDriver {
 public:
  ConnectionDriver(network::ConnectorSharedPtr connector,
                   ExchangeOptions options);

  Single<HttpClientResponsePtr> acquire(const Uri& target,
                                        HttpMethod method,
                                        RequestHandler handler,
                                        RedirectHistory history = {}) const;

  const ExchangeOptions& options() const { return options_; }

  // Install the client pipeline stages on a new channel
  static void initializePipeline(network::Channel& channel);

 private:
  network::ConnectorSharedPtr connector_;
  const ExchangeOptions options_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_CONNECTION_DRIVER_H
