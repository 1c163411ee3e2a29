#ifndef CONDUIT_HTTP_HTTP_AGGREGATOR_H
#define CONDUIT_HTTP_HTTP_AGGREGATOR_H

#include <cstddef>
#include <memory>

#include "conduit/http/http_object.h"
#include "conduit/network/filter.h"

namespace conduit {
namespace http {

/**
 * Collects a response head and its content into one FullHttpResponse.
 *
 * Inserted in front of the reactive bridge while a WebSocket handshake
 * response is awaited. A body larger than max_content_length is reported
 * as an HttpDecoderFailure. Messages other than HTTP objects pass through.
 */
class HttpAggregator : public network::ReadFilter {
 public:
  static constexpr const char* kName = "http_aggregator";
  static constexpr size_t kDefaultMaxContentLength = 8192;

  explicit HttpAggregator(size_t max_content_length = kDefaultMaxContentLength)
      : max_content_length_(max_content_length) {}

  void initializeReadFilterCallbacks(
      network::ReadFilterCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }
  void onRead(network::MessagePtr message) override;

 private:
  network::ReadFilterCallbacks* callbacks_{nullptr};
  const size_t max_content_length_;
  std::unique_ptr<FullHttpResponse> current_;
  bool too_long_{false};
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_AGGREGATOR_H
