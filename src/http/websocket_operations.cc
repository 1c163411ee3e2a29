#include "conduit/http/websocket_operations.h"

#include <fmt/format.h>

#include "conduit/event/event_loop.h"
#include "conduit/http/client_errors.h"
#include "conduit/http/http_aggregator.h"
#include "conduit/http/http_client_codec.h"

#define CONDUIT_LOG_COMPONENT "http.websocket"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

namespace {

Error upgradeFailed(const std::string& reason) {
  return clientError(ClientErrorCode::UpgradeFailed,
                     "Failed to upgrade to websocket: " + reason);
}

bool isHandshakeHeader(const std::string& name) {
  static const char* const kNames[] = {
      "Host", "Upgrade", "Connection", "Sec-WebSocket-Key",
      "Sec-WebSocket-Version", "Sec-WebSocket-Protocol"};
  for (const char* handshake_name : kNames) {
    if (equalsIgnoreCase(name, handshake_name)) {
      return true;
    }
  }
  return false;
}

}  // namespace

WebSocketOperations::WebSocketOperations(HttpClientOperationsSharedPtr exchange,
                                         ResponseSinkPtr response_sink,
                                         Uri target,
                                         std::string sub_protocols,
                                         bool text_mode,
                                         HttpHeaders extra_headers)
    : exchange_(std::move(exchange)),
      channel_(exchange_->channel()),
      response_sink_(std::move(response_sink)),
      target_(std::move(target)),
      sub_protocols_(std::move(sub_protocols)),
      text_mode_(text_mode),
      extra_headers_(std::move(extra_headers)) {}

void WebSocketOperations::runInDispatcher(std::function<void()> fn) {
  event::Dispatcher& dispatcher = channel_->dispatcher();
  if (dispatcher.isThreadSafe()) {
    fn();
    return;
  }
  auto self = shared_from_this();
  dispatcher.post([self, fn]() { fn(); });
}

std::string WebSocketOperations::encodeHandshake() const {
  HttpHeaders headers;
  headers.set("Host", target_.authority());
  headers.set("Upgrade", "websocket");
  headers.set("Connection", "Upgrade");
  headers.set("Sec-WebSocket-Key", key_);
  headers.set("Sec-WebSocket-Version", "13");
  if (!sub_protocols_.empty()) {
    headers.set("Sec-WebSocket-Protocol", sub_protocols_);
  }
  for (const auto& entry : extra_headers_) {
    if (!isHandshakeHeader(entry.first)) {
      headers.add(entry.first, entry.second);
    }
  }
  return HttpClientCodec::encodeRequestHead(
      HttpMethod::GET, target_.pathAndQuery(), HttpVersion::HTTP_1_1, headers);
}

void WebSocketOperations::start(WebSocketHandler handler,
                                CompletionSinkPtr<std::nullptr_t> upgrade_sink) {
  handler_ = std::move(handler);
  upgrade_sink_ = std::move(upgrade_sink);

  std::weak_ptr<WebSocketOperations> weak = shared_from_this();
  upgrade_sink_->onCancel([weak]() {
    if (auto self = weak.lock()) {
      auto channel = self->channel_;
      self->runInDispatcher([channel]() { channel->close(); });
    }
  });

  Result<std::string> key = generateWebSocketKey();
  if (auto* error = get_error(key)) {
    CONDUIT_LOG_WARNING("channel {} {}", channel_->id(), error->message);
    failUpgrade(upgradeFailed(error->message));
    return;
  }
  key_ = std::move(*get_value(key));

  CONDUIT_LOG_DEBUG("channel {} sending websocket handshake to {}",
                    channel_->id(), target_.toString());
  OwnedBuffer buffer(encodeHandshake());
  channel_->write(buffer);
}

void WebSocketOperations::onInboundNext(network::MessagePtr message) {
  if (auto* response = dynamic_cast<FullHttpResponse*>(message.get())) {
    if (handshake_complete_) {
      CONDUIT_LOG_DEBUG("channel {} unexpected http response after handshake",
                        channel_->id());
      return;
    }
    onHandshakeResponse(*response);
    return;
  }
  if (auto* bytes = dynamic_cast<network::BytesMessage*>(message.get())) {
    if (!handshake_complete_) {
      CONDUIT_LOG_DEBUG("channel {} frame data before handshake, dropped",
                        channel_->id());
      return;
    }
    onBytes(*bytes);
    return;
  }
  CONDUIT_LOG_DEBUG("channel {} dropped unexpected inbound message",
                    channel_->id());
}

optional<Error> WebSocketOperations::validateHandshake(
    const HttpResponseHead& head) const {
  if (head.status != 101) {
    return upgradeFailed(
        fmt::format("Invalid handshake response status: {}", head.status));
  }
  if (!head.headers.containsToken("Upgrade", "websocket")) {
    return upgradeFailed("Invalid handshake response upgrade: " +
                         head.headers.get("Upgrade").value_or(""));
  }
  if (!head.headers.containsToken("Connection", "upgrade")) {
    return upgradeFailed("Invalid handshake response connection: " +
                         head.headers.get("Connection").value_or(""));
  }
  optional<std::string> accept = head.headers.get("Sec-WebSocket-Accept");
  if (!accept || *accept != computeWebSocketAccept(key_)) {
    return upgradeFailed("Invalid challenge");
  }
  optional<std::string> selected = head.headers.get("Sec-WebSocket-Protocol");
  if (selected && !selected->empty()) {
    HttpHeaders offered;
    offered.set("Sec-WebSocket-Protocol", sub_protocols_);
    if (!offered.containsToken("Sec-WebSocket-Protocol", trim(*selected))) {
      return upgradeFailed("Invalid subprotocol: " + *selected);
    }
  }
  return nullopt;
}

void WebSocketOperations::onHandshakeResponse(const FullHttpResponse& response) {
  exchange_->setResponseState(response.head);
  if (optional<Error> error = validateHandshake(response.head)) {
    CONDUIT_LOG_DEBUG("channel {} {}", channel_->id(), error->message);
    failUpgrade(*error);
    return;
  }

  handshake_complete_ = true;
  handshake_headers_ = response.head.headers;
  channel_->pipeline().remove(HttpAggregator::kName);
  CONDUIT_LOG_DEBUG("channel {} websocket handshake complete", channel_->id());

  response_sink_->success(exchange_);
  exchange_->receive()->complete();

  auto self = shared_from_this();
  Completion completion = Completion::just(nullptr);
  try {
    completion = handler_(*this, *this);
  } catch (const std::exception& e) {
    onHandlerResult(makeError<std::nullptr_t>(
        clientError(ClientErrorCode::HandlerError, e.what())));
    return;
  }
  handler_subscription_ =
      completion.subscribe([self](Result<std::nullptr_t> result) {
        self->runInDispatcher([self, result]() { self->onHandlerResult(result); });
      });
}

void WebSocketOperations::onHandlerResult(const Result<std::nullptr_t>& result) {
  if (const Error* error = get_error(result)) {
    CONDUIT_LOG_DEBUG("channel {} websocket handler failed: {}",
                      channel_->id(), error->message);
    upgrade_sink_->error(*error);
    channel_->close();
    return;
  }
  if (!close_sent_ && channel_->isOpen()) {
    writeFrame(WebSocketOpcode::Close, encodeClosePayload(kCloseNormal, ""));
    close_sent_ = true;
  }
  upgrade_sink_->success(nullptr);
  if (close_received_) {
    channel_->close();
  }
}

void WebSocketOperations::failUpgrade(const Error& error) {
  response_sink_->error(error);
  if (upgrade_sink_) {
    upgrade_sink_->error(error);
  }
  channel_->close();
}

void WebSocketOperations::onBytes(network::BytesMessage& bytes) {
  OwnedBuffer& data = bytes.data();
  size_t length = data.length();
  const char* raw = static_cast<const char*>(data.linearize(length));

  std::vector<WebSocketFrame> frames;
  VoidResult decoded = decoder_.decode(raw, length, frames);
  for (auto& frame : frames) {
    if (inbound_done_ || !channel_->isOpen()) {
      return;
    }
    onFrame(frame);
  }
  if (const Error* error = get_error(decoded)) {
    if (!close_sent_) {
      writeFrame(WebSocketOpcode::Close,
                 encodeClosePayload(kCloseProtocolError, ""));
      close_sent_ = true;
    }
    finishInbound(*error);
    channel_->close();
  }
}

void WebSocketOperations::onFrame(WebSocketFrame& frame) {
  auto protocolError = [this](const std::string& reason) {
    if (!close_sent_) {
      writeFrame(WebSocketOpcode::Close,
                 encodeClosePayload(kCloseProtocolError, reason));
      close_sent_ = true;
    }
    finishInbound(clientError(ClientErrorCode::ProtocolError, reason));
    channel_->close();
  };

  switch (frame.opcode) {
    case WebSocketOpcode::Text:
    case WebSocketOpcode::Binary:
      if (fragment_opcode_) {
        protocolError("New data frame inside a fragmented message");
        return;
      }
      if (frame.fin) {
        deliver(WebSocketMessage{frame.opcode == WebSocketOpcode::Text,
                                 std::move(frame.payload)});
      } else {
        fragment_opcode_ = frame.opcode;
        fragment_ = std::move(frame.payload);
      }
      return;
    case WebSocketOpcode::Continuation:
      if (!fragment_opcode_) {
        protocolError("Continuation frame without a message");
        return;
      }
      fragment_ += frame.payload;
      if (frame.fin) {
        bool text = *fragment_opcode_ == WebSocketOpcode::Text;
        fragment_opcode_ = nullopt;
        std::string data;
        data.swap(fragment_);
        deliver(WebSocketMessage{text, std::move(data)});
      }
      return;
    case WebSocketOpcode::Ping:
      writeFrame(WebSocketOpcode::Pong, frame.payload);
      return;
    case WebSocketOpcode::Pong:
      return;
    case WebSocketOpcode::Close:
      close_received_ = true;
      CONDUIT_LOG_DEBUG("channel {} received close {}", channel_->id(),
                        decodeCloseCode(frame.payload));
      if (!close_sent_) {
        // Echo the status code only
        writeFrame(WebSocketOpcode::Close, frame.payload.substr(0, 2));
        close_sent_ = true;
      }
      finishInbound(nullopt);
      channel_->close();
      return;
  }
  protocolError(fmt::format("Unknown opcode {}",
                            static_cast<int>(frame.opcode)));
}

void WebSocketOperations::deliver(WebSocketMessage message) {
  if (subscribed_ && on_message_) {
    // The receiver may end the session from inside the callback
    OnMessage on_message = on_message_;
    on_message(std::move(message));
    return;
  }
  pending_.push_back(std::move(message));
}

void WebSocketOperations::finishInbound(const optional<Error>& error) {
  if (inbound_done_) {
    return;
  }
  inbound_done_ = true;
  done_error_ = error;
  if (!subscribed_) {
    return;
  }
  OnDone on_done;
  on_done.swap(on_done_);
  on_message_ = nullptr;
  if (on_done) {
    on_done(error);
  }
}

void WebSocketOperations::onInboundClose() {
  if (!handshake_complete_) {
    failUpgrade(connectionClosed());
    return;
  }
  if (close_received_) {
    finishInbound(nullopt);
  } else {
    finishInbound(clientError(ClientErrorCode::ConnectionClosed,
                              "WebSocket closed without a close frame"));
  }
  if (upgrade_sink_ && !upgrade_sink_->isTerminated()) {
    if (handler_subscription_) {
      handler_subscription_->dispose();
    }
    if (close_received_) {
      upgrade_sink_->success(nullptr);
    } else {
      upgrade_sink_->error(connectionClosed());
    }
  }
}

void WebSocketOperations::onInboundError(const Error& error) {
  if (!handshake_complete_) {
    failUpgrade(upgradeFailed(error.message));
    return;
  }
  finishInbound(error);
  channel_->close();
}

void WebSocketOperations::receive(OnMessage on_message, OnDone on_done) {
  auto self = shared_from_this();
  runInDispatcher([self, on_message, on_done]() {
    if (self->subscribed_) {
      if (on_done) {
        on_done(clientError(ClientErrorCode::NotActive,
                            "Only one WebSocket receiver is allowed"));
      }
      return;
    }
    self->subscribed_ = true;
    self->on_message_ = on_message;
    self->on_done_ = on_done;
    while (!self->pending_.empty() && self->on_message_) {
      WebSocketMessage message = std::move(self->pending_.front());
      self->pending_.pop_front();
      OnMessage on_message = self->on_message_;
      on_message(std::move(message));
    }
    if (self->inbound_done_) {
      OnDone done;
      done.swap(self->on_done_);
      self->on_message_ = nullptr;
      if (done) {
        done(self->done_error_);
      }
    }
  });
}

std::string WebSocketOperations::selectedSubprotocol() const {
  return handshake_headers_.get("Sec-WebSocket-Protocol").value_or("");
}

HttpHeaders WebSocketOperations::handshakeHeaders() const {
  return handshake_headers_;
}

Completion WebSocketOperations::send(const std::string& data) {
  return sendFrame(text_mode_ ? WebSocketOpcode::Text : WebSocketOpcode::Binary,
                   data);
}

Completion WebSocketOperations::sendText(const std::string& text) {
  return sendFrame(WebSocketOpcode::Text, text);
}

Completion WebSocketOperations::sendBinary(const std::string& data) {
  return sendFrame(WebSocketOpcode::Binary, data);
}

Completion WebSocketOperations::ping(const std::string& payload) {
  return sendFrame(WebSocketOpcode::Ping, payload.substr(0, 125));
}

Completion WebSocketOperations::sendClose(uint16_t code,
                                          const std::string& reason) {
  return sendFrame(WebSocketOpcode::Close, encodeClosePayload(code, reason));
}

Completion WebSocketOperations::sendFrame(WebSocketOpcode opcode,
                                          const std::string& payload) {
  auto self = shared_from_this();
  return Completion(
      [self, opcode, payload](const CompletionSinkPtr<std::nullptr_t>& sink) {
        self->runInDispatcher([self, opcode, payload, sink]() {
          if (!self->handshake_complete_ || !self->channel_->isOpen()) {
            sink->error(clientError(ClientErrorCode::NotActive,
                                    "WebSocket session is not open"));
            return;
          }
          if (self->close_sent_) {
            sink->error(clientError(ClientErrorCode::NotActive,
                                    "WebSocket close already sent"));
            return;
          }
          if (!self->writeFrame(opcode, payload)) {
            sink->error(clientError(ClientErrorCode::NotActive,
                                    "WebSocket session failed while sending"));
            return;
          }
          if (opcode == WebSocketOpcode::Close) {
            self->close_sent_ = true;
            if (self->close_received_) {
              self->channel_->close();
            }
          }
          sink->success(nullptr);
        });
      });
}

bool WebSocketOperations::writeFrame(WebSocketOpcode opcode,
                                     const std::string& payload) {
  WebSocketFrame frame;
  frame.fin = true;
  frame.opcode = opcode;
  frame.payload = payload;
  Result<std::string> encoded = encodeClientFrame(frame);
  if (auto* error = get_error(encoded)) {
    // Nothing more can be sent; the session ends with the failure
    CONDUIT_LOG_WARNING("channel {} {}", channel_->id(), error->message);
    close_sent_ = true;
    finishInbound(*error);
    if (upgrade_sink_) {
      upgrade_sink_->error(*error);
    }
    channel_->close();
    return false;
  }
  OwnedBuffer buffer(*get_value(encoded));
  channel_->write(buffer);
  return true;
}

}  // namespace http
}  // namespace conduit
