#ifndef CONDUIT_HTTP_WEBSOCKET_OPERATIONS_H
#define CONDUIT_HTTP_WEBSOCKET_OPERATIONS_H

#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "conduit/core/completion_sink.h"
#include "conduit/core/single.h"
#include "conduit/http/http_client_operations.h"
#include "conduit/http/http_client_request.h"
#include "conduit/http/http_headers.h"
#include "conduit/http/uri.h"
#include "conduit/http/websocket_frame.h"
#include "conduit/network/channel.h"
#include "conduit/network/operations_slot.h"

namespace conduit {
namespace http {

// One complete data message, reassembled from its fragments
struct WebSocketMessage {
  bool text{false};
  std::string data;
};

/**
 * Receiving side of a WebSocket session.
 */
class WebSocketInbound {
 public:
  using OnMessage = std::function<void(WebSocketMessage message)>;
  // nullopt after a close handshake, the failure otherwise
  using OnDone = std::function<void(const optional<Error>& error)>;

  virtual ~WebSocketInbound() = default;

  // Single subscriber; messages received before it are buffered
  virtual void receive(OnMessage on_message, OnDone on_done) = 0;

  // Sub-protocol chosen by the server, empty if none
  virtual std::string selectedSubprotocol() const = 0;

  virtual HttpHeaders handshakeHeaders() const = 0;
};

/**
 * Sending side of a WebSocket session. Sends are lazy like every other
 * Completion and may be subscribed from any thread.
 */
class WebSocketOutbound {
 public:
  virtual ~WebSocketOutbound() = default;

  // Text or binary, as chosen when upgrading
  virtual Completion send(const std::string& data) = 0;
  virtual Completion sendText(const std::string& text) = 0;
  virtual Completion sendBinary(const std::string& data) = 0;
  virtual Completion ping(const std::string& payload) = 0;
  virtual Completion sendClose(uint16_t code, const std::string& reason) = 0;
};

class WebSocketOperations;
using WebSocketOperationsSharedPtr = std::shared_ptr<WebSocketOperations>;

/**
 * Channel owner after an HTTP exchange was upgraded.
 *
 * Sends the opening handshake, validates the 101 response, then invokes
 * the user handler once. The upgrade completion terminates with the
 * handler's completion; a normal end of the handler closes the session.
 */
class WebSocketOperations
    : public network::ChannelOperations,
      public WebSocketInbound,
      public WebSocketOutbound,
      public std::enable_shared_from_this<WebSocketOperations> {
 public:
  WebSocketOperations(HttpClientOperationsSharedPtr exchange,
                      ResponseSinkPtr response_sink,
                      Uri target,
                      std::string sub_protocols,
                      bool text_mode,
                      HttpHeaders extra_headers);

  /**
   * Write the handshake. Called once this object owns the channel.
   * upgrade_sink terminates after handler's completion does.
   */
  void start(WebSocketHandler handler,
             CompletionSinkPtr<std::nullptr_t> upgrade_sink);

  bool handshakeComplete() const { return handshake_complete_; }
  const Uri& target() const { return target_; }

  // network::ChannelOperations
  void onInboundNext(network::MessagePtr message) override;
  void onInboundClose() override;
  void onInboundError(const Error& error) override;
  std::string name() const override { return "websocket_client"; }

  // WebSocketInbound
  void receive(OnMessage on_message, OnDone on_done) override;
  std::string selectedSubprotocol() const override;
  HttpHeaders handshakeHeaders() const override;

  // WebSocketOutbound
  Completion send(const std::string& data) override;
  Completion sendText(const std::string& text) override;
  Completion sendBinary(const std::string& data) override;
  Completion ping(const std::string& payload) override;
  Completion sendClose(uint16_t code, const std::string& reason) override;

 private:
  // Request head of the opening handshake
  std::string encodeHandshake() const;
  void onHandshakeResponse(const FullHttpResponse& response);
  optional<Error> validateHandshake(const HttpResponseHead& head) const;
  void onBytes(network::BytesMessage& bytes);
  void onFrame(WebSocketFrame& frame);
  void deliver(WebSocketMessage message);
  void finishInbound(const optional<Error>& error);
  void failUpgrade(const Error& error);
  void onHandlerResult(const Result<std::nullptr_t>& result);

  Completion sendFrame(WebSocketOpcode opcode, const std::string& payload);
  // False when the frame could not be masked; the session is then failed
  bool writeFrame(WebSocketOpcode opcode, const std::string& payload);
  void runInDispatcher(std::function<void()> fn);

  HttpClientOperationsSharedPtr exchange_;
  network::ChannelSharedPtr channel_;
  ResponseSinkPtr response_sink_;
  const Uri target_;
  const std::string sub_protocols_;
  const bool text_mode_;
  const HttpHeaders extra_headers_;
  std::string key_;

  WebSocketHandler handler_;
  CompletionSinkPtr<std::nullptr_t> upgrade_sink_;
  DisposablePtr handler_subscription_;

  // Dispatcher thread only
  bool handshake_complete_{false};
  bool close_sent_{false};
  bool close_received_{false};
  bool inbound_done_{false};
  HttpHeaders handshake_headers_;
  WebSocketFrameDecoder decoder_;
  optional<WebSocketOpcode> fragment_opcode_;
  std::string fragment_;
  std::deque<WebSocketMessage> pending_;
  optional<Error> done_error_;
  OnMessage on_message_;
  OnDone on_done_;
  bool subscribed_{false};
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_WEBSOCKET_OPERATIONS_H
