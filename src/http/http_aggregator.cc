#include "conduit/http/http_aggregator.h"

#include <fmt/format.h>

#define CONDUIT_LOG_COMPONENT "http.aggregator"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

void HttpAggregator::onRead(network::MessagePtr message) {
  if (auto* head = dynamic_cast<HttpResponseHead*>(message.get())) {
    current_ = std::make_unique<FullHttpResponse>();
    current_->head = std::move(*head);
    too_long_ = false;
    return;
  }

  auto* content = dynamic_cast<HttpContent*>(message.get());
  if (!content) {
    callbacks_->fireRead(std::move(message));
    return;
  }
  if (!current_) {
    if (!too_long_) {
      CONDUIT_LOG_DEBUG("content without a response head, dropped");
    }
    if (dynamic_cast<HttpLastContent*>(content)) {
      too_long_ = false;
    }
    return;
  }

  if (current_->body.size() + content->data.size() > max_content_length_) {
    CONDUIT_LOG_DEBUG("response body exceeds {} bytes", max_content_length_);
    current_.reset();
    // Swallow the rest of this response
    too_long_ = !dynamic_cast<HttpLastContent*>(content);
    callbacks_->fireRead(std::make_unique<HttpDecoderFailure>(
        fmt::format("response exceeds {} bytes", max_content_length_)));
    return;
  }
  current_->body += content->data;

  if (dynamic_cast<HttpLastContent*>(content)) {
    network::MessagePtr full = std::move(current_);
    callbacks_->fireRead(std::move(full));
  }
}

}  // namespace http
}  // namespace conduit
