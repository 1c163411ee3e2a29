#include "conduit/http/connection_driver.h"

#include "conduit/http/client_errors.h"
#include "conduit/http/http_client_codec.h"
#include "conduit/http/reactive_bridge.h"

#define CONDUIT_LOG_COMPONENT "http.driver"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

ConnectionDriver::ConnectionDriver(network::ConnectorSharedPtr connector,
                                   ExchangeOptions options)
    : connector_(std::move(connector)), options_(std::move(options)) {}

void ConnectionDriver::initializePipeline(network::Channel& channel) {
  channel.pipeline().addLast(HttpClientCodec::kName,
                             std::make_shared<HttpClientCodec>());
  channel.pipeline().addLast(ReactiveBridge::kName,
                             std::make_shared<ReactiveBridge>());
}

Single<HttpClientResponsePtr> ConnectionDriver::acquire(
    const Uri& target,
    HttpMethod method,
    RequestHandler handler,
    RedirectHistory history) const {
  network::ConnectorSharedPtr connector = connector_;
  ExchangeOptions options = options_;

  return Single<HttpClientResponsePtr>(
      [connector, options, target, method, handler,
       history](const ResponseSinkPtr& sink) {
        network::ConnectRequest request;
        request.host = target.host();
        request.port = target.port();
        request.secure = target.secure();

        CONDUIT_LOG_DEBUG("connecting to {}:{} for {}", request.host,
                          request.port, target.toString());

        DisposablePtr pending = connector->connect(
            request,
            [sink, options, target, method, handler,
             history](Result<network::ChannelSharedPtr> result) {
              if (auto* error = get_error(result)) {
                CONDUIT_LOG_DEBUG("connect to {} failed: {}",
                                  target.toString(), error->message);
                Error failure = hasCode(*error, ClientErrorCode::ConnectFailure)
                                    ? *error
                                    : connectFailure(error->message);
                sink->error(failure);
                return;
              }

              network::ChannelSharedPtr channel =
                  std::move(*get_value(result));
              if (sink->isTerminated()) {
                channel->close();
                return;
              }

              initializePipeline(*channel);
              auto ops = HttpClientOperations::create(channel, sink, options);
              ops->prepareRequest(target, method);
              ops->setRedirectHistory(history);
              channel->operations().set(ops);
              ops->start(handler);
            });

        sink->onCancel([pending]() { pending->dispose(); });
      });
}

}  // namespace http
}  // namespace conduit
