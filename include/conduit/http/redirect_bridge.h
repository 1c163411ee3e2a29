#ifndef CONDUIT_HTTP_REDIRECT_BRIDGE_H
#define CONDUIT_HTTP_REDIRECT_BRIDGE_H

#include <memory>

#include "conduit/core/single.h"
#include "conduit/http/connection_driver.h"
#include "conduit/http/http_client_request.h"
#include "conduit/http/http_client_response.h"
#include "conduit/http/uri.h"

namespace conduit {
namespace http {

/**
 * Follows redirects by retrying the driver.
 *
 * A Redirect failure from an attempt appends the attempt's target to the
 * history, moves the target to the redirect location and subscribes to
 * the driver again on a new connection. Every other outcome ends the
 * request unchanged. Attempts run strictly one after another.
 */
class RedirectBridge {
 public:
  explicit RedirectBridge(std::shared_ptr<const ConnectionDriver> driver)
      : driver_(std::move(driver)) {}

  Single<HttpClientResponsePtr> request(const Uri& target,
                                        HttpMethod method,
                                        RequestHandler handler) const;

 private:
  std::shared_ptr<const ConnectionDriver> driver_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_REDIRECT_BRIDGE_H
