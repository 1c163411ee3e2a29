#ifndef CONDUIT_HTTP_HTTP_CLIENT_RESPONSE_H
#define CONDUIT_HTTP_HTTP_CLIENT_RESPONSE_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include "conduit/core/single.h"
#include "conduit/http/body_stream.h"
#include "conduit/http/cookie.h"
#include "conduit/http/http_headers.h"
#include "conduit/http/http_parser.h"
#include "conduit/http/redirect_history.h"
#include "conduit/network/address.h"

namespace conduit {
namespace http {

/**
 * Inbound side of one HTTP exchange, handed out once the response head
 * has arrived and passed the status checks.
 */
class HttpClientResponse {
 public:
  virtual ~HttpClientResponse() = default;

  virtual int status() const = 0;
  virtual std::string reason() const = 0;
  virtual HttpVersion responseVersion() const = 0;
  virtual HttpHeaders responseHeaders() const = 0;
  // Parsed Set-Cookie headers
  virtual CookieMap responseCookies() const = 0;
  virtual RedirectHistory redirectedFrom() const = 0;

  // The body; it accepts a single subscriber
  virtual BodyStreamSharedPtr receive() = 0;

  virtual bool isDisposed() const = 0;
  virtual network::AddressConstSharedPtr remoteAddress() const = 0;

  // Close the connection
  virtual void dispose() = 0;

  // Completes when the connection closes
  virtual Completion onClose() = 0;

  // cb runs when nothing is read for timeout; re-armed by every read
  virtual void onReadIdle(std::chrono::milliseconds timeout,
                          std::function<void()> cb) = 0;
};

using HttpClientResponsePtr = std::shared_ptr<HttpClientResponse>;

// Aggregates the whole body
Single<std::string> receiveString(HttpClientResponse& response);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_CLIENT_RESPONSE_H
