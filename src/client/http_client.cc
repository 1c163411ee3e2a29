#include "conduit/client/http_client.h"

#include <fmt/format.h>

#include "conduit/event/libevent_dispatcher.h"
#include "conduit/http/client_errors.h"
#include "conduit/http/redirect_bridge.h"
#include "conduit/logging/log_level.h"
#include "conduit/logging/log_sink.h"
#include "conduit/logging/logger_registry.h"

#define CONDUIT_LOG_COMPONENT "client"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace client {

namespace {

http::ExchangeOptions toExchangeOptions(const config::ClientConfig& config) {
  http::ExchangeOptions options;
  options.follow_redirect = config.follow_redirect;
  options.max_redirects = config.max_redirects;
  options.duplicate_response_head = config.duplicate_response_head == "fail"
                                        ? http::DuplicateHeadPolicy::Fail
                                        : http::DuplicateHeadPolicy::Ignore;
  options.read_buffer_high_watermark = config.read_buffer_high_watermark;
  options.websocket_max_aggregate_bytes = config.websocket_max_aggregate_bytes;
  options.response_timeout =
      std::chrono::milliseconds(config.response_timeout_ms);
  return options;
}

network::TcpConnectorConfig toConnectorConfig(
    const config::ClientConfig& config,
    transport::SslContextSharedPtr ssl_context) {
  network::TcpConnectorConfig connector_config;
  connector_config.socket_options.tcp_no_delay = config.tcp_no_delay;
  connector_config.socket_options.keep_alive = config.keep_alive;
  connector_config.socket_options.linger_seconds = config.linger_seconds;
  connector_config.socket_options.receive_buffer_size =
      static_cast<int>(config.rcvbuf);
  connector_config.socket_options.send_buffer_size =
      static_cast<int>(config.sndbuf);
  connector_config.channel_options.write_buffer_high_watermark =
      static_cast<uint32_t>(config.write_buffer_high_watermark);
  connector_config.connect_timeout =
      std::chrono::milliseconds(config.connect_timeout_ms);
  connector_config.ssl_handshake_timeout =
      std::chrono::milliseconds(config.ssl_handshake_timeout_ms);
  connector_config.ssl_context = std::move(ssl_context);
  return connector_config;
}

}  // namespace

HttpClient::HttpClient(const config::ClientConfig& config)
    : config_(config), options_(toExchangeOptions(config)) {
  config_.validate();
  initialize();

  transport::SslContextConfig ssl_config;
  ssl_config.verify_peer = config_.verify_peer;
  ssl_config.ca_file = config_.ca_file;
  Result<transport::SslContextSharedPtr> ssl_context =
      transport::SslContext::create(ssl_config);
  if (auto* error = get_error(ssl_context)) {
    throw config::ConfigValidationError("client.ca_file", error->message);
  }

  dispatcher_factory_ = std::make_unique<event::LibeventDispatcherFactory>();
  workers_ = std::make_unique<event::WorkerPool>(config_.worker_threads,
                                                 *dispatcher_factory_);
  for (size_t i = 0; i < workers_->size(); ++i) {
    connectors_.push_back(std::make_shared<network::TcpConnector>(
        workers_->getWorker(i).dispatcher(),
        toConnectorConfig(config_, *get_value(ssl_context))));
  }
  workers_->start();
  CONDUIT_LOG_INFO("http client started with {} worker(s)", workers_->size());
}

HttpClient::HttpClient(const config::ClientConfig& config,
                       network::ConnectorSharedPtr connector)
    : config_(config), options_(toExchangeOptions(config)) {
  config_.validate();
  initialize();
  connectors_.push_back(std::move(connector));
}

HttpClient::~HttpClient() {
  if (workers_) {
    workers_->stop();
  }
}

void HttpClient::initialize() {
  logging::LoggerRegistry& registry = logging::LoggerRegistry::instance();
  registry.setGlobalLevel(
      logging::parseLogLevel(config_.log_level).value_or(logging::LogLevel::Info));
  for (const auto& entry : config_.log_levels) {
    registry.setPattern(entry.first, *logging::parseLogLevel(entry.second));
  }

  // The default sink is only replaced when the configuration asks for it
  const logging::LogFormat format =
      logging::parseLogFormat(config_.log_format).value_or(logging::LogFormat::Text);
  if (!config_.log_file.empty()) {
    logging::RotatingFileSink::Config file_config;
    file_config.base_filename = config_.log_file;
    file_config.max_file_size = config_.log_max_file_size;
    file_config.max_files = config_.log_max_files;
    registry.setDefaultSink(
        logging::SinkFactory::createFileSink(file_config, format));
  } else if (format != logging::LogFormat::Text) {
    registry.setDefaultSink(logging::SinkFactory::createStdioSink(true, format));
  }
}

network::ConnectorSharedPtr HttpClient::nextConnector() {
  size_t index = next_connector_.fetch_add(1) % connectors_.size();
  return connectors_[index];
}

Result<http::Uri> HttpClient::resolveUrl(const std::string& url) const {
  Result<http::Uri> absolute = http::Uri::parse(url);
  if (is_success(absolute) || config_.host.empty()) {
    return absolute;
  }
  std::string base = "http://" + config_.host;
  if (config_.port != 0) {
    base += fmt::format(":{}", config_.port);
  }
  Result<http::Uri> base_uri = http::Uri::parse(base + "/");
  if (is_error(base_uri)) {
    return base_uri;
  }
  return conduit::get<http::Uri>(base_uri).resolve(url);
}

Single<http::HttpClientResponsePtr> HttpClient::get(
    const std::string& url, http::RequestHandler handler) {
  return request(http::HttpMethod::GET, url, std::move(handler));
}

Single<http::HttpClientResponsePtr> HttpClient::post(
    const std::string& url, http::RequestHandler handler) {
  return request(http::HttpMethod::POST, url, std::move(handler));
}

Single<http::HttpClientResponsePtr> HttpClient::put(
    const std::string& url, http::RequestHandler handler) {
  return request(http::HttpMethod::PUT, url, std::move(handler));
}

Single<http::HttpClientResponsePtr> HttpClient::remove(
    const std::string& url, http::RequestHandler handler) {
  return request(http::HttpMethod::DELETE, url, std::move(handler));
}

Single<http::HttpClientResponsePtr> HttpClient::request(
    http::HttpMethod method,
    const std::string& url,
    http::RequestHandler handler) {
  Result<http::Uri> target = resolveUrl(url);
  if (auto* error = get_error(target)) {
    return Single<http::HttpClientResponsePtr>::error(*error);
  }
  auto driver =
      std::make_shared<const http::ConnectionDriver>(nextConnector(), options_);
  http::RedirectBridge bridge(driver);
  return bridge.request(conduit::get<http::Uri>(target), method, std::move(handler));
}

Result<http::Uri> HttpClient::resolveWebSocketUrl(const std::string& url) const {
  Result<http::Uri> target = resolveUrl(url);
  if (is_error(target)) {
    return target;
  }
  http::Uri ws_target = conduit::get<http::Uri>(target);
  if (!ws_target.isWebSocket()) {
    ws_target = ws_target.withScheme(ws_target.secure() ? "wss" : "ws");
  }
  return ws_target;
}

Single<http::HttpClientResponsePtr> HttpClient::ws(
    const std::string& url,
    http::WebSocketHandler handler,
    const std::string& sub_protocols) {
  Result<http::Uri> target = resolveWebSocketUrl(url);
  if (auto* error = get_error(target)) {
    return Single<http::HttpClientResponsePtr>::error(*error);
  }
  std::string upgrade_url = conduit::get<http::Uri>(target).toString();
  return request(http::HttpMethod::GET, upgrade_url,
                 [upgrade_url, sub_protocols,
                  handler](http::HttpClientRequest& req) {
                   return req.upgradeToWebsocket(upgrade_url, sub_protocols,
                                                 false, handler);
                 });
}

Completion HttpClient::websocket(const std::string& url,
                                 http::WebSocketHandler handler) {
  Result<http::Uri> target = resolveWebSocketUrl(url);
  if (auto* error = get_error(target)) {
    return Completion::error(*error);
  }
  http::Uri ws_target = conduit::get<http::Uri>(target);
  auto driver =
      std::make_shared<const http::ConnectionDriver>(nextConnector(), options_);

  return Completion([driver, ws_target, handler](
                        const CompletionSinkPtr<std::nullptr_t>& session) {
    // The session ends with the handler, or with the upgrade when the
    // connection goes away first
    http::WebSocketHandler wrapped = [handler, session](
                                         http::WebSocketInbound& in,
                                         http::WebSocketOutbound& out) {
      Completion completion = Completion::just(nullptr);
      try {
        completion = handler(in, out);
      } catch (const std::exception& e) {
        Error error = http::clientError(http::ClientErrorCode::HandlerError,
                                        e.what());
        session->error(error);
        return Completion::error(error);
      }
      return completion.doOnResult(
          [session](const Result<std::nullptr_t>& result) {
            session->complete(result);
          });
    };
    std::string upgrade_url = ws_target.toString();
    http::RedirectBridge bridge(driver);
    DisposablePtr subscription =
        bridge
            .request(ws_target, http::HttpMethod::GET,
                     [upgrade_url, wrapped,
                      session](http::HttpClientRequest& req) {
                       return req
                           .upgradeToWebsocket(upgrade_url, "", false, wrapped)
                           .doOnResult(
                               [session](const Result<std::nullptr_t>& result) {
                                 session->complete(result);
                               });
                     })
            .subscribe([session](Result<http::HttpClientResponsePtr> response) {
              if (auto* error = get_error(response)) {
                session->error(*error);
              }
            });
    session->onCancel([subscription]() { subscription->dispose(); });
  });
}

}  // namespace client
}  // namespace conduit
