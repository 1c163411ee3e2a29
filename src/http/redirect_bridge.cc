#include "conduit/http/redirect_bridge.h"

#include <algorithm>
#include <mutex>

#include "conduit/http/client_errors.h"
#include "conduit/http/redirect_history.h"

#define CONDUIT_LOG_COMPONENT "http.redirect"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

namespace {

// Target and history of one request, carried across its attempts
struct RedirectState {
  std::mutex mutex;
  Uri active_target;
  RedirectHistory history;
};

// A redirect that was not followed ends the request as a plain failure
Error unfollowedRedirect(const Error& redirect,
                         const RedirectHistory& history,
                         size_t cap) {
  const int status = redirect.status.value_or(0);
  if (!redirect.location) {
    return httpStatusError(status, "Redirect without a location");
  }
  if (!history.canFollow(cap)) {
    return httpStatusError(status, "Too many redirects");
  }
  return clientError(ClientErrorCode::InvalidUri,
                     "Invalid redirect location: " + *redirect.location);
}

}  // namespace

Single<HttpClientResponsePtr> RedirectBridge::request(
    const Uri& target,
    HttpMethod method,
    RequestHandler handler) const {
  std::shared_ptr<const ConnectionDriver> driver = driver_;

  return Single<HttpClientResponsePtr>(
      [driver, target, method, handler](const ResponseSinkPtr& sink) {
        // Fresh state per subscription
        auto state = std::make_shared<RedirectState>();
        state->active_target = target;

        Single<HttpClientResponsePtr> attempt =
            Single<HttpClientResponsePtr>::defer([driver, method, handler,
                                                  state]() {
              std::lock_guard<std::mutex> lock(state->mutex);
              return driver->acquire(state->active_target, method, handler,
                                     state->history);
            });

        const size_t cap = std::min(driver->options().max_redirects,
                                    RedirectHistory::kMaxRedirects);
        auto upstream = std::make_shared<CompletionSink<HttpClientResponsePtr>>(
            [sink, state, cap](Result<HttpClientResponsePtr> result) {
              const Error* error = get_error(result);
              if (error && isRedirect(*error)) {
                std::lock_guard<std::mutex> lock(state->mutex);
                sink->error(unfollowedRedirect(*error, state->history, cap));
                return;
              }
              sink->complete(std::move(result));
            });
        std::weak_ptr<CompletionSink<HttpClientResponsePtr>> weak_upstream =
            upstream;
        sink->onCancel([weak_upstream]() {
          if (auto up = weak_upstream.lock()) {
            up->cancel();
          }
        });

        attempt
            .retryWhen([state, cap](const Error& error) {
              if (!isRedirect(error) || !error.location) {
                return false;
              }
              std::lock_guard<std::mutex> lock(state->mutex);
              if (!state->history.canFollow(cap)) {
                return false;
              }
              Result<Uri> next = state->active_target.resolve(*error.location);
              if (is_error(next)) {
                return false;
              }
              state->history =
                  state->history.append(state->active_target.toString());
              state->active_target = get<Uri>(next);
              CONDUIT_LOG_DEBUG("following redirect {} of {} to {}",
                                state->history.size(), cap,
                                state->active_target.toString());
              return true;
            })
            .subscribeSink(upstream);
      });
}

}  // namespace http
}  // namespace conduit
