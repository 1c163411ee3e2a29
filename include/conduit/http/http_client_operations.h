#ifndef CONDUIT_HTTP_HTTP_CLIENT_OPERATIONS_H
#define CONDUIT_HTTP_HTTP_CLIENT_OPERATIONS_H

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "conduit/core/completion_sink.h"
#include "conduit/core/disposable.h"
#include "conduit/event/event_loop.h"
#include "conduit/http/body_stream.h"
#include "conduit/http/http_aggregator.h"
#include "conduit/http/http_client_request.h"
#include "conduit/http/http_client_response.h"
#include "conduit/http/http_object.h"
#include "conduit/http/uri.h"
#include "conduit/network/channel.h"
#include "conduit/network/operations_slot.h"

namespace conduit {
namespace http {

// What to do with a second response head on the same exchange
enum class DuplicateHeadPolicy { Ignore, Fail };

struct ExchangeOptions {
  bool follow_redirect{false};
  size_t max_redirects{RedirectHistory::kMaxRedirects};
  DuplicateHeadPolicy duplicate_response_head{DuplicateHeadPolicy::Ignore};
  size_t read_buffer_high_watermark{64 * 1024};
  size_t websocket_max_aggregate_bytes{HttpAggregator::kDefaultMaxContentLength};
  // Zero disables the response head timeout
  std::chrono::milliseconds response_timeout{0};
};

using ResponseSinkPtr = CompletionSinkPtr<HttpClientResponsePtr>;

class HttpClientOperations;
using HttpClientOperationsSharedPtr = std::shared_ptr<HttpClientOperations>;

/**
 * One request/response exchange over one channel.
 *
 * Owns the outbound request head, the inbound response state and the body
 * stream, and resolves the driver's sink exactly once: with itself when
 * an acceptable response head arrives, or with the first failure.
 *
 * Lifecycle:
 *   Idle -> HeadersSent -> AwaitingResponse
 *        -> ResponseReceived -> BodyStreaming -> Closed
 *        |  Redirected | Failed
 *
 * Inbound events arrive on the channel's dispatcher thread. The request
 * mutators and the headers-sent latch may be used from any thread.
 */
class HttpClientOperations
    : public network::ChannelOperations,
      public HttpClientRequest,
      public HttpClientResponse,
      public std::enable_shared_from_this<HttpClientOperations> {
 public:
  static HttpClientOperationsSharedPtr create(network::ChannelSharedPtr channel,
                                              ResponseSinkPtr sink,
                                              const ExchangeOptions& options);

  ~HttpClientOperations() override;

  /**
   * Request line and default headers for target: path and query, HTTP/1.1,
   * Host, Accept. Chunked transfer is off for GET and HEAD.
   */
  void prepareRequest(const Uri& target, HttpMethod method);

  // Stamped by the driver before the handler runs
  void setRedirectHistory(RedirectHistory history);

  // Runs handler, or sends bare headers when there is none
  void start(RequestHandler handler);

  // Sets the latch; true only for the call that set it
  bool markHeadersSent();

  // Records the response state unless one exists; true if recorded
  bool setResponseState(const HttpResponseHead& head);

  void onResponseHeadersReceived(const HttpResponseHead& head);
  void onBodyChunkReceived(const HttpContent& content);

  const Uri& target() const { return target_; }
  const network::ChannelSharedPtr& channel() const { return channel_; }
  bool hasResponse() const;

  // network::ChannelOperations
  void onInboundNext(network::MessagePtr message) override;
  void onInboundClose() override;
  void onInboundError(const Error& error) override;
  std::string name() const override { return "http_client"; }

  // HttpClientRequest
  HttpClientRequest& addHeader(const std::string& name,
                               const std::string& value) override;
  HttpClientRequest& header(const std::string& name,
                            const std::string& value) override;
  HttpClientRequest& addCookie(const Cookie& cookie) override;
  HttpClientRequest& followRedirect() override;
  HttpClientRequest& keepAlive(bool keep_alive) override;
  HttpClientRequest& disableChunkedTransfer() override;
  HttpClientRequest& flushEach() override;
  bool isFollowRedirect() const override;
  bool isKeepAlive() const override;
  bool hasSentHeaders() const override { return headers_sent_.load(); }
  bool isDisposed() const override { return disposed_.load(); }
  HttpMethod method() const override { return method_; }
  std::string uri() const override;
  HttpVersion version() const override { return HttpVersion::HTTP_1_1; }
  HttpHeaders requestHeaders() const override;
  std::vector<Cookie> cookies() const override;
  RedirectHistory redirectedFrom() const override;
  Completion sendHeaders() override;
  Completion send(const std::string& body) override;
  Completion sendStream(BodySource source) override;
  Completion upgradeToWebsocket(const std::string& path,
                                const std::string& sub_protocols,
                                bool text_mode,
                                WebSocketHandler handler) override;

  // HttpClientResponse
  int status() const override;
  std::string reason() const override;
  HttpVersion responseVersion() const override;
  HttpHeaders responseHeaders() const override;
  CookieMap responseCookies() const override;
  BodyStreamSharedPtr receive() override { return body_; }
  network::AddressConstSharedPtr remoteAddress() const override {
    return channel_->remoteAddress();
  }
  void dispose() override;
  Completion onClose() override;
  void onReadIdle(std::chrono::milliseconds timeout,
                  std::function<void()> cb) override;

 private:
  struct ResponseState {
    HttpResponseHead head;
    mutable std::once_flag cookies_once;
    mutable CookieMap cookies;
  };

  class StreamWriter;

  HttpClientOperations(network::ChannelSharedPtr channel,
                       ResponseSinkPtr sink,
                       const ExchangeOptions& options);

  void initialize();
  void runInDispatcher(std::function<void()> fn);
  void checkHeadersNotSent() const;

  std::shared_ptr<const ResponseState> responseState() const;
  void classifyResponse(const HttpResponseHead& head);
  void fail(const Error& error);
  void closeChannel();

  std::string encodeHead();
  void writeHead();
  void writeBody(const std::string& data);
  void finishRequest();
  void write(const std::string& data);
  void armResponseTimer();
  void onResponseTimeout();
  void onWritabilityChanged(bool writable);

  void doSendHeaders(const CompletionSinkPtr<std::nullptr_t>& sink);
  void doSend(const std::string& body,
              const CompletionSinkPtr<std::nullptr_t>& sink);
  void doUpgrade(const std::string& path,
                 const std::string& sub_protocols,
                 bool text_mode,
                 const WebSocketHandler& handler,
                 const CompletionSinkPtr<std::nullptr_t>& sink);

  network::ChannelSharedPtr channel_;
  event::Dispatcher& dispatcher_;
  ResponseSinkPtr sink_;
  const ExchangeOptions options_;
  BodyStreamSharedPtr body_;

  // Outbound request
  Uri target_;
  HttpMethod method_{HttpMethod::GET};
  mutable std::mutex request_mutex_;
  std::string uri_;
  HttpHeaders headers_;
  std::vector<Cookie> cookies_;
  bool chunked_{true};
  bool keep_alive_{true};
  bool flush_each_{false};
  std::atomic<bool> redirectable_{false};
  std::atomic<bool> headers_sent_{false};
  RedirectHistory history_;

  // Dispatcher thread only
  bool head_written_{false};
  bool request_complete_{false};
  bool upgraded_{false};
  bool failed_{false};
  std::shared_ptr<StreamWriter> stream_writer_;
  event::TimerPtr response_timer_;
  event::TimerPtr read_idle_timer_;
  std::chrono::milliseconds read_idle_timeout_{0};
  std::function<void()> read_idle_cb_;
  DisposablePtr handler_subscription_;

  // Written once on the dispatcher, read from any thread
  mutable std::mutex response_mutex_;
  std::shared_ptr<const ResponseState> response_;

  std::atomic<bool> disposed_{false};
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_CLIENT_OPERATIONS_H
