#include "conduit/http/http_client_operations.h"

#include <algorithm>

#include <fmt/format.h>

#include "conduit/http/client_errors.h"
#include "conduit/http/http_client_codec.h"
#include "conduit/http/reactive_bridge.h"
#include "conduit/http/websocket_operations.h"

#define CONDUIT_LOG_COMPONENT "http.client"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

namespace {

const char kChunkTerminator[] = "0\r\n\r\n";

// Streamed chunks are coalesced up to this size unless flushEach() is set
constexpr size_t kStreamBatchBytes = 8192;

std::string frameChunk(const std::string& data) {
  return fmt::format("{:x}\r\n", data.size()) + data + "\r\n";
}

bool startsWithIgnoreCase(const std::string& value, const std::string& prefix) {
  return value.size() >= prefix.size() &&
         equalsIgnoreCase(value.substr(0, prefix.size()), prefix);
}

Error notActive() {
  return clientError(ClientErrorCode::NotActive,
                     "This outbound is not active anymore");
}

}  // namespace

/**
 * Pulls a request body from a BodySource while the channel is writable.
 */
class HttpClientOperations::StreamWriter {
 public:
  StreamWriter(BodySource source, CompletionSinkPtr<std::nullptr_t> sink)
      : source_(std::move(source)), sink_(std::move(sink)) {}

  void pump(HttpClientOperations& ops) {
    std::string batch;
    while (!sink_->isTerminated() && ops.channel_->isOpen()) {
      if (!ops.channel_->isWritable()) {
        CONDUIT_LOG_DEBUG("channel {} not writable, body stream suspended",
                          ops.channel_->id());
        break;
      }
      std::string chunk;
      bool more = false;
      try {
        more = source_(chunk);
      } catch (const std::exception& e) {
        ops.stream_writer_.reset();
        sink_->error(clientError(ClientErrorCode::HandlerError, e.what()));
        return;
      }
      if (!more) {
        if (!batch.empty()) {
          ops.write(batch);
        }
        if (ops.chunked_) {
          ops.write(kChunkTerminator);
        }
        ops.request_complete_ = true;
        ops.stream_writer_.reset();
        sink_->success(nullptr);
        return;
      }
      if (chunk.empty()) {
        continue;
      }
      std::string framed = ops.chunked_ ? frameChunk(chunk) : chunk;
      if (ops.flush_each_) {
        ops.write(framed);
        continue;
      }
      batch += framed;
      if (batch.size() >= kStreamBatchBytes) {
        ops.write(batch);
        batch.clear();
      }
    }
    if (!batch.empty()) {
      ops.write(batch);
    }
  }

  void fail(const Error& error) { sink_->error(error); }

 private:
  BodySource source_;
  CompletionSinkPtr<std::nullptr_t> sink_;
};

HttpClientOperationsSharedPtr HttpClientOperations::create(
    network::ChannelSharedPtr channel,
    ResponseSinkPtr sink,
    const ExchangeOptions& options) {
  HttpClientOperationsSharedPtr ops(
      new HttpClientOperations(std::move(channel), std::move(sink), options));
  ops->initialize();
  return ops;
}

HttpClientOperations::HttpClientOperations(network::ChannelSharedPtr channel,
                                           ResponseSinkPtr sink,
                                           const ExchangeOptions& options)
    : channel_(std::move(channel)),
      dispatcher_(channel_->dispatcher()),
      sink_(std::move(sink)),
      options_(options),
      body_(std::make_shared<BodyStream>(channel_->dispatcher(),
                                         options.read_buffer_high_watermark)),
      redirectable_(options.follow_redirect) {}

HttpClientOperations::~HttpClientOperations() {
  if (dispatcher_.isThreadSafe()) {
    return;
  }
  // Timers belong to the dispatcher thread
  auto timers = std::make_shared<std::vector<event::TimerPtr>>();
  if (response_timer_) {
    timers->push_back(std::move(response_timer_));
  }
  if (read_idle_timer_) {
    timers->push_back(std::move(read_idle_timer_));
  }
  if (!timers->empty()) {
    dispatcher_.post([timers]() { timers->clear(); });
  }
}

void HttpClientOperations::initialize() {
  std::weak_ptr<HttpClientOperations> weak = shared_from_this();

  channel_->addWritabilityCallback([weak](bool writable) {
    if (auto self = weak.lock()) {
      self->onWritabilityChanged(writable);
    }
  });
  body_->setReadControl([weak](bool disable) {
    if (auto self = weak.lock()) {
      self->channel_->readDisable(disable);
    }
  });
  body_->setCancelCallback([weak]() {
    if (auto self = weak.lock()) {
      self->closeChannel();
    }
  });
  if (sink_) {
    sink_->onCancel([weak]() {
      if (auto self = weak.lock()) {
        CONDUIT_LOG_DEBUG("channel {} exchange cancelled",
                          self->channel_->id());
        self->dispose();
      }
    });
  }
  if (options_.response_timeout.count() > 0) {
    response_timer_ = dispatcher_.createTimer([weak]() {
      if (auto self = weak.lock()) {
        self->onResponseTimeout();
      }
    });
  }
}

void HttpClientOperations::runInDispatcher(std::function<void()> fn) {
  if (dispatcher_.isThreadSafe()) {
    fn();
    return;
  }
  auto self = shared_from_this();
  dispatcher_.post([self, fn]() { fn(); });
}

void HttpClientOperations::prepareRequest(const Uri& target,
                                          HttpMethod method) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  target_ = target;
  method_ = method;
  uri_ = target.pathAndQuery();
  headers_.set("Host", target.authority());
  headers_.set("Accept", "*/*");
  chunked_ = method != HttpMethod::GET && method != HttpMethod::HEAD;
}

void HttpClientOperations::setRedirectHistory(RedirectHistory history) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  history_ = std::move(history);
}

void HttpClientOperations::start(RequestHandler handler) {
  auto self = shared_from_this();
  if (!handler) {
    {
      std::lock_guard<std::mutex> lock(request_mutex_);
      if (!headers_sent_.load()) {
        chunked_ = false;
      }
    }
    handler_subscription_ =
        sendHeaders().subscribe([self](Result<std::nullptr_t> result) {
          if (auto* error = get_error(result)) {
            self->fail(*error);
          }
        });
    return;
  }

  Completion completion = Completion::just(nullptr);
  try {
    completion = handler(*this);
  } catch (const ClientException& e) {
    fail(e.error());
    return;
  } catch (const std::exception& e) {
    CONDUIT_LOG_DEBUG("channel {} request handler threw: {}", channel_->id(),
                      e.what());
    fail(clientError(ClientErrorCode::HandlerError, e.what()));
    return;
  }

  handler_subscription_ =
      completion.subscribe([self](Result<std::nullptr_t> result) {
        self->runInDispatcher([self, result]() {
          if (auto* error = get_error(result)) {
            self->fail(*error);
          } else {
            self->finishRequest();
          }
        });
      });
}

bool HttpClientOperations::markHeadersSent() {
  bool expected = false;
  return headers_sent_.compare_exchange_strong(expected, true);
}

void HttpClientOperations::checkHeadersNotSent() const {
  if (headers_sent_.load()) {
    throw ClientException(clientError(ClientErrorCode::HeaderLocked,
                                      "Status and headers already sent"));
  }
}

HttpClientRequest& HttpClientOperations::addHeader(const std::string& name,
                                                   const std::string& value) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  checkHeadersNotSent();
  headers_.add(name, value);
  return *this;
}

HttpClientRequest& HttpClientOperations::header(const std::string& name,
                                                const std::string& value) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  checkHeadersNotSent();
  headers_.set(name, value);
  return *this;
}

HttpClientRequest& HttpClientOperations::addCookie(const Cookie& cookie) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  checkHeadersNotSent();
  cookies_.push_back(cookie);
  headers_.set("Cookie", encodeClientCookies(cookies_));
  return *this;
}

HttpClientRequest& HttpClientOperations::followRedirect() {
  redirectable_ = true;
  return *this;
}

HttpClientRequest& HttpClientOperations::keepAlive(bool keep_alive) {
  std::lock_guard<std::mutex> lock(request_mutex_);
  checkHeadersNotSent();
  keep_alive_ = keep_alive;
  return *this;
}

HttpClientRequest& HttpClientOperations::disableChunkedTransfer() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  checkHeadersNotSent();
  chunked_ = false;
  return *this;
}

HttpClientRequest& HttpClientOperations::flushEach() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  flush_each_ = true;
  return *this;
}

bool HttpClientOperations::isFollowRedirect() const {
  size_t cap = std::min(options_.max_redirects, RedirectHistory::kMaxRedirects);
  return redirectable_.load() && redirectedFrom().canFollow(cap);
}

bool HttpClientOperations::isKeepAlive() const {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return keep_alive_;
}

std::string HttpClientOperations::uri() const {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return uri_;
}

HttpHeaders HttpClientOperations::requestHeaders() const {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return headers_;
}

std::vector<Cookie> HttpClientOperations::cookies() const {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return cookies_;
}

RedirectHistory HttpClientOperations::redirectedFrom() const {
  std::lock_guard<std::mutex> lock(request_mutex_);
  return history_;
}

std::string HttpClientOperations::encodeHead() {
  std::lock_guard<std::mutex> lock(request_mutex_);
  HttpHeaders headers = headers_;
  if (headers.has("Content-Length")) {
    chunked_ = false;
  }
  if (chunked_) {
    headers.set("Transfer-Encoding", "chunked");
  }
  if (!keep_alive_) {
    headers.set("Connection", "close");
  }
  return HttpClientCodec::encodeRequestHead(method_, uri_, version(), headers);
}

void HttpClientOperations::writeHead() {
  auto codec =
      channel_->pipeline().getAs<HttpClientCodec>(HttpClientCodec::kName);
  if (codec) {
    codec->expectResponseTo(method_);
  }
  std::string head = encodeHead();
  head_written_ = true;
  CONDUIT_LOG_DEBUG("channel {} sending {} {}", channel_->id(),
                    httpMethodToString(method_), uri());
  write(head);
  armResponseTimer();
}

void HttpClientOperations::writeBody(const std::string& data) {
  if (data.empty()) {
    return;
  }
  write(chunked_ ? frameChunk(data) : data);
}

void HttpClientOperations::write(const std::string& data) {
  if (!channel_->isOpen()) {
    return;
  }
  OwnedBuffer buffer(data);
  channel_->write(buffer);
}

void HttpClientOperations::finishRequest() {
  if (upgraded_ || failed_ || disposed_.load()) {
    return;
  }
  if (!head_written_) {
    if (!markHeadersSent()) {
      return;
    }
    writeHead();
  }
  if (chunked_ && !request_complete_ && !stream_writer_) {
    write(kChunkTerminator);
  }
  request_complete_ = true;
}

Completion HttpClientOperations::sendHeaders() {
  auto self = shared_from_this();
  return Completion([self](const CompletionSinkPtr<std::nullptr_t>& sink) {
    self->runInDispatcher([self, sink]() { self->doSendHeaders(sink); });
  });
}

void HttpClientOperations::doSendHeaders(
    const CompletionSinkPtr<std::nullptr_t>& sink) {
  if (disposed_.load()) {
    sink->error(notActive());
    return;
  }
  if (markHeadersSent()) {
    writeHead();
    sink->success(nullptr);
    return;
  }
  if (head_written_) {
    sink->success(nullptr);
    return;
  }
  sink->error(clientError(ClientErrorCode::HeaderLocked,
                          "Headers already committed by another operation"));
}

Completion HttpClientOperations::send(const std::string& body) {
  auto self = shared_from_this();
  return Completion([self, body](const CompletionSinkPtr<std::nullptr_t>& sink) {
    self->runInDispatcher([self, body, sink]() { self->doSend(body, sink); });
  });
}

void HttpClientOperations::doSend(
    const std::string& body,
    const CompletionSinkPtr<std::nullptr_t>& sink) {
  if (disposed_.load()) {
    sink->error(notActive());
    return;
  }
  if (markHeadersSent()) {
    {
      std::lock_guard<std::mutex> lock(request_mutex_);
      chunked_ = false;
      headers_.set("Content-Length", std::to_string(body.size()));
    }
    writeHead();
    write(body);
    request_complete_ = true;
    sink->success(nullptr);
    return;
  }
  if (!head_written_) {
    sink->error(clientError(ClientErrorCode::HeaderLocked,
                            "Headers already committed by another operation"));
    return;
  }
  if (request_complete_ || stream_writer_) {
    sink->error(clientError(ClientErrorCode::ProtocolError,
                            "Request body already complete"));
    return;
  }
  writeBody(body);
  sink->success(nullptr);
}

Completion HttpClientOperations::sendStream(BodySource source) {
  auto self = shared_from_this();
  return Completion(
      [self, source](const CompletionSinkPtr<std::nullptr_t>& sink) {
        self->runInDispatcher([self, source, sink]() {
          if (self->disposed_.load()) {
            sink->error(notActive());
            return;
          }
          if (self->stream_writer_ || self->request_complete_) {
            sink->error(clientError(ClientErrorCode::ProtocolError,
                                    "Request body already complete"));
            return;
          }
          if (self->markHeadersSent()) {
            self->writeHead();
          } else if (!self->head_written_) {
            sink->error(
                clientError(ClientErrorCode::HeaderLocked,
                            "Headers already committed by another operation"));
            return;
          }
          auto writer = std::make_shared<StreamWriter>(source, sink);
          self->stream_writer_ = writer;
          writer->pump(*self);
        });
      });
}

void HttpClientOperations::onWritabilityChanged(bool writable) {
  if (!writable || !stream_writer_) {
    return;
  }
  auto writer = stream_writer_;
  writer->pump(*this);
}

Completion HttpClientOperations::upgradeToWebsocket(
    const std::string& path,
    const std::string& sub_protocols,
    bool text_mode,
    WebSocketHandler handler) {
  auto self = shared_from_this();
  return Completion([self, path, sub_protocols, text_mode, handler](
                        const CompletionSinkPtr<std::nullptr_t>& sink) {
    self->runInDispatcher([self, path, sub_protocols, text_mode, handler,
                           sink]() {
      self->doUpgrade(path, sub_protocols, text_mode, handler, sink);
    });
  });
}

void HttpClientOperations::doUpgrade(
    const std::string& path,
    const std::string& sub_protocols,
    bool text_mode,
    const WebSocketHandler& handler,
    const CompletionSinkPtr<std::nullptr_t>& sink) {
  if (disposed_.load() || !channel_->isOpen()) {
    sink->error(notActive());
    return;
  }
  if (!handler) {
    sink->error(clientError(ClientErrorCode::UpgradeFailed,
                            "Failed to upgrade to websocket: no handler"));
    return;
  }

  const bool secure = target_.secure() || channel_->secure();
  std::string url = path.empty() ? uri() : path;
  if (!startsWithIgnoreCase(url, "http") && !startsWithIgnoreCase(url, "ws")) {
    std::string host =
        requestHeaders().get("Host").value_or(target_.authority());
    url = std::string(secure ? "wss" : "ws") + "://" + host +
          (url.compare(0, 1, "/") == 0 ? url : "/" + url);
  }
  Result<Uri> parsed = Uri::parse(url);
  if (auto* error = get_error(parsed)) {
    sink->error(clientError(ClientErrorCode::UpgradeFailed,
                            "Failed to upgrade to websocket: " +
                                error->message));
    return;
  }
  Uri ws_target = get<Uri>(parsed);
  if (!ws_target.isWebSocket()) {
    ws_target = ws_target.withScheme(ws_target.secure() ? "wss" : "ws");
  }

  HttpHeaders extra_headers = requestHeaders();
  extra_headers.remove("Host");
  extra_headers.remove("Transfer-Encoding");
  extra_headers.remove("Content-Length");

  if (!markHeadersSent()) {
    sink->error(clientError(ClientErrorCode::UpgradeTooLate,
                            "Failed to upgrade to websocket: "
                            "status and headers already sent"));
    return;
  }

  auto ws = std::make_shared<WebSocketOperations>(
      shared_from_this(), sink_, ws_target, sub_protocols, text_mode,
      extra_headers);
  network::ChannelOperationsSharedPtr current = shared_from_this();
  if (!channel_->operations().compareAndSet(current, ws)) {
    sink->error(clientError(ClientErrorCode::UpgradeConflict,
                            "Failed to upgrade to websocket: "
                            "channel is owned by another handler"));
    return;
  }
  upgraded_ = true;
  CONDUIT_LOG_DEBUG("channel {} upgrading to {}", channel_->id(),
                    ws_target.toString());

  channel_->pipeline().addBefore(
      ReactiveBridge::kName, HttpAggregator::kName,
      std::make_shared<HttpAggregator>(options_.websocket_max_aggregate_bytes));
  auto codec =
      channel_->pipeline().getAs<HttpClientCodec>(HttpClientCodec::kName);
  if (codec) {
    codec->expectResponseTo(HttpMethod::GET);
  }
  armResponseTimer();
  ws->start(handler, sink);
}

bool HttpClientOperations::setResponseState(const HttpResponseHead& head) {
  std::lock_guard<std::mutex> lock(response_mutex_);
  if (response_) {
    return false;
  }
  auto state = std::make_shared<ResponseState>();
  state->head = head;
  response_ = std::move(state);
  if (response_timer_) {
    response_timer_->disableTimer();
  }
  return true;
}

std::shared_ptr<const HttpClientOperations::ResponseState>
HttpClientOperations::responseState() const {
  std::lock_guard<std::mutex> lock(response_mutex_);
  return response_;
}

bool HttpClientOperations::hasResponse() const {
  return responseState() != nullptr;
}

void HttpClientOperations::onResponseHeadersReceived(
    const HttpResponseHead& head) {
  if (!setResponseState(head)) {
    if (options_.duplicate_response_head == DuplicateHeadPolicy::Fail) {
      fail(clientError(
          ClientErrorCode::ProtocolError,
          fmt::format("Unexpected second response head ({})", head.status)));
    } else {
      CONDUIT_LOG_DEBUG("channel {} ignoring second response head ({})",
                        channel_->id(), head.status);
    }
    return;
  }
  CONDUIT_LOG_DEBUG("channel {} received response {} {}", channel_->id(),
                    head.status, head.reason);
  classifyResponse(head);
}

void HttpClientOperations::classifyResponse(const HttpResponseHead& head) {
  HttpVersion version = head.version();
  if (version != HttpVersion::HTTP_1_0 && version != HttpVersion::HTTP_1_1) {
    fail(clientError(ClientErrorCode::UnsupportedVersion,
                     fmt::format("HTTP/{}.{} not supported",
                                 head.version_major, head.version_minor)));
    return;
  }

  const int code = head.status;
  if (code < 300) {
    sink_->success(shared_from_this());
    return;
  }
  if (code < 400 && isFollowRedirect()) {
    optional<std::string> location = head.headers.get("Location");
    if (location) {
      Result<Uri> next = target_.resolve(*location);
      if (auto* error = get_error(next)) {
        fail(*error);
        return;
      }
      CONDUIT_LOG_DEBUG("channel {} redirected ({}) to {}", channel_->id(),
                        code, *location);
      fail(redirectError(code, get<Uri>(next).toString()));
      return;
    }
  }
  CONDUIT_LOG_DEBUG("channel {} failed status check", channel_->id());
  fail(httpStatusError(code, head.reason));
}

void HttpClientOperations::onBodyChunkReceived(const HttpContent& content) {
  body_->push(content.data);
}

void HttpClientOperations::onInboundNext(network::MessagePtr message) {
  if (read_idle_timer_ && read_idle_timeout_.count() > 0) {
    read_idle_timer_->enableTimer(read_idle_timeout_);
  }
  if (failed_) {
    return;
  }

  if (auto* head = dynamic_cast<HttpResponseHead*>(message.get())) {
    onResponseHeadersReceived(*head);
    return;
  }
  if (auto* last = dynamic_cast<HttpLastContent*>(message.get())) {
    onBodyChunkReceived(*last);
    CONDUIT_LOG_DEBUG("channel {} read last http packet", channel_->id());
    body_->complete();
    closeChannel();
    return;
  }
  if (auto* content = dynamic_cast<HttpContent*>(message.get())) {
    onBodyChunkReceived(*content);
    return;
  }
  CONDUIT_LOG_DEBUG("channel {} dropped unexpected inbound message",
                    channel_->id());
}

void HttpClientOperations::onInboundClose() {
  disposed_ = true;
  if (response_timer_) {
    response_timer_->disableTimer();
  }
  if (read_idle_timer_) {
    read_idle_timer_->disableTimer();
  }
  if (stream_writer_) {
    auto writer = std::move(stream_writer_);
    writer->fail(connectionClosed());
  }
  sink_->error(connectionClosed());
  body_->fail(clientError(ClientErrorCode::ConnectionClosed,
                          "Connection closed before the body completed"));
}

void HttpClientOperations::onInboundError(const Error& error) {
  fail(error);
}

void HttpClientOperations::fail(const Error& error) {
  if (failed_) {
    return;
  }
  failed_ = true;
  CONDUIT_LOG_DEBUG(
      "channel {} exchange failed: {} ({})", channel_->id(),
      clientErrorCodeName(static_cast<ClientErrorCode>(error.code)),
      error.message);
  if (response_timer_) {
    response_timer_->disableTimer();
  }
  sink_->error(error);
  body_->fail(error);
  closeChannel();
}

void HttpClientOperations::closeChannel() {
  auto channel = channel_;
  runInDispatcher([channel]() { channel->close(); });
}

void HttpClientOperations::dispose() {
  disposed_ = true;
  closeChannel();
}

void HttpClientOperations::armResponseTimer() {
  if (response_timer_ && !hasResponse()) {
    response_timer_->enableTimer(options_.response_timeout);
  }
}

void HttpClientOperations::onResponseTimeout() {
  if (hasResponse()) {
    return;
  }
  CONDUIT_LOG_DEBUG("channel {} response timed out", channel_->id());
  fail(clientError(ClientErrorCode::Timeout,
                   fmt::format("No response within {} ms",
                               options_.response_timeout.count())));
}

Completion HttpClientOperations::onClose() {
  auto self = shared_from_this();
  return Completion([self](const CompletionSinkPtr<std::nullptr_t>& sink) {
    self->runInDispatcher([self, sink]() {
      self->channel_->addCloseCallback([sink]() { sink->success(nullptr); });
    });
  });
}

void HttpClientOperations::onReadIdle(std::chrono::milliseconds timeout,
                                      std::function<void()> cb) {
  auto self = shared_from_this();
  runInDispatcher([self, timeout, cb]() {
    self->read_idle_timeout_ = timeout;
    self->read_idle_cb_ = cb;
    if (!self->read_idle_timer_) {
      std::weak_ptr<HttpClientOperations> weak = self;
      self->read_idle_timer_ = self->dispatcher_.createTimer([weak]() {
        auto ops = weak.lock();
        if (ops && ops->read_idle_cb_) {
          ops->read_idle_cb_();
        }
      });
    }
    self->read_idle_timer_->enableTimer(timeout);
  });
}

int HttpClientOperations::status() const {
  auto state = responseState();
  return state ? state->head.status : 0;
}

std::string HttpClientOperations::reason() const {
  auto state = responseState();
  return state ? state->head.reason : std::string();
}

HttpVersion HttpClientOperations::responseVersion() const {
  auto state = responseState();
  return state ? state->head.version() : HttpVersion::HTTP_1_1;
}

HttpHeaders HttpClientOperations::responseHeaders() const {
  auto state = responseState();
  return state ? state->head.headers : HttpHeaders();
}

CookieMap HttpClientOperations::responseCookies() const {
  auto state = responseState();
  if (!state) {
    return CookieMap();
  }
  std::call_once(state->cookies_once, [&state]() {
    for (const auto& value : state->head.headers.getAll("Set-Cookie")) {
      optional<Cookie> cookie = parseSetCookie(value);
      if (cookie) {
        state->cookies[cookie->name].push_back(*cookie);
      }
    }
  });
  return state->cookies;
}

Completion upgradeToWebsocket(HttpClientRequest& request,
                              WebSocketHandler handler) {
  return request.upgradeToWebsocket("", "", false, std::move(handler));
}

Completion upgradeToTextWebsocket(HttpClientRequest& request,
                                  WebSocketHandler handler) {
  return request.upgradeToWebsocket("", "", true, std::move(handler));
}

Single<std::string> receiveString(HttpClientResponse& response) {
  BodyStreamSharedPtr body = response.receive();
  return body->aggregate();
}

}  // namespace http
}  // namespace conduit
