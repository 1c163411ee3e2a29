#ifndef CONDUIT_HTTP_HTTP_OBJECT_H
#define CONDUIT_HTTP_HTTP_OBJECT_H

#include <cstdint>
#include <memory>
#include <string>

#include "conduit/http/http_headers.h"
#include "conduit/http/http_parser.h"
#include "conduit/network/filter.h"

namespace conduit {
namespace http {

/**
 * Decoded response status line and headers.
 */
class HttpResponseHead : public network::Message {
 public:
  int status{0};
  std::string reason;
  uint8_t version_major{1};
  uint8_t version_minor{1};
  HttpHeaders headers;
  bool keep_alive{true};
  // The server agreed to switch protocols
  bool upgrade{false};

  HttpVersion version() const {
    return httpVersionFromNumbers(version_major, version_minor);
  }
};

/**
 * Body bytes of the current response.
 */
class HttpContent : public network::Message {
 public:
  HttpContent() = default;
  explicit HttpContent(std::string d) : data(std::move(d)) {}

  std::string data;
};

/**
 * Terminal marker of a response; may carry the last bytes of its body.
 */
class HttpLastContent : public HttpContent {
 public:
  using HttpContent::HttpContent;
};

/**
 * Head and complete body, produced by the aggregator.
 */
class FullHttpResponse : public network::Message {
 public:
  HttpResponseHead head;
  std::string body;
};

/**
 * The response bytes could not be decoded. Nothing follows it.
 */
class HttpDecoderFailure : public network::Message {
 public:
  explicit HttpDecoderFailure(std::string r) : reason(std::move(r)) {}

  std::string reason;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_OBJECT_H
