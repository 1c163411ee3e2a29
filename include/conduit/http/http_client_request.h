#ifndef CONDUIT_HTTP_HTTP_CLIENT_REQUEST_H
#define CONDUIT_HTTP_HTTP_CLIENT_REQUEST_H

#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "conduit/core/compat.h"
#include "conduit/core/single.h"
#include "conduit/http/cookie.h"
#include "conduit/http/http_headers.h"
#include "conduit/http/http_parser.h"
#include "conduit/http/redirect_history.h"

namespace conduit {
namespace http {

class WebSocketInbound;
class WebSocketOutbound;

// Invoked once the WebSocket handshake has completed
using WebSocketHandler =
    std::function<Completion(WebSocketInbound&, WebSocketOutbound&)>;

class HttpClientRequest;

// Drives one exchange: may set headers, then sends the request
using RequestHandler = std::function<Completion(HttpClientRequest&)>;

// Pulls the next chunk of a streamed request body; returns false at the end
using BodySource = std::function<bool(std::string& chunk)>;

/**
 * Outbound side of one HTTP exchange.
 *
 * Header and cookie mutators throw ClientException(HeaderLocked) once the
 * request head has been committed to the wire. The send operations are
 * lazy: nothing is written until the returned completion is subscribed.
 */
class HttpClientRequest {
 public:
  virtual ~HttpClientRequest() = default;

  virtual HttpClientRequest& addHeader(const std::string& name,
                                       const std::string& value) = 0;
  virtual HttpClientRequest& header(const std::string& name,
                                    const std::string& value) = 0;
  virtual HttpClientRequest& addCookie(const Cookie& cookie) = 0;

  virtual HttpClientRequest& followRedirect() = 0;
  virtual HttpClientRequest& keepAlive(bool keep_alive) = 0;
  virtual HttpClientRequest& disableChunkedTransfer() = 0;
  // Write every chunk of a streamed body as soon as it is produced
  virtual HttpClientRequest& flushEach() = 0;

  virtual bool isFollowRedirect() const = 0;
  virtual bool isKeepAlive() const = 0;
  virtual bool hasSentHeaders() const = 0;
  virtual bool isDisposed() const = 0;

  virtual HttpMethod method() const = 0;
  virtual std::string uri() const = 0;
  virtual HttpVersion version() const = 0;
  // Snapshot
  virtual HttpHeaders requestHeaders() const = 0;
  // Cookies added to this request
  virtual std::vector<Cookie> cookies() const = 0;
  virtual RedirectHistory redirectedFrom() const = 0;

  virtual Completion sendHeaders() = 0;
  // Whole body with a Content-Length, or one chunk once headers are out
  virtual Completion send(const std::string& body) = 0;
  virtual Completion sendStream(BodySource source) = 0;

  /**
   * Switch this exchange to WebSocket. path may be absolute or relative
   * to the request's Host. sub_protocols is a comma separated list, empty
   * for none. The completion fires after handler's completion does.
   */
  virtual Completion upgradeToWebsocket(const std::string& path,
                                        const std::string& sub_protocols,
                                        bool text_mode,
                                        WebSocketHandler handler) = 0;
};

// Upgrade on the request's own path, binary frames by default
Completion upgradeToWebsocket(HttpClientRequest& request,
                              WebSocketHandler handler);

// Upgrade on the request's own path, text frames by default
Completion upgradeToTextWebsocket(HttpClientRequest& request,
                                  WebSocketHandler handler);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_CLIENT_REQUEST_H
