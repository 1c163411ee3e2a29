#ifndef CONDUIT_HTTP_HTTP_CLIENT_CODEC_H
#define CONDUIT_HTTP_HTTP_CLIENT_CODEC_H

#include <memory>
#include <string>
#include <vector>

#include "conduit/http/http_object.h"
#include "conduit/http/http_parser.h"
#include "conduit/network/filter.h"

namespace conduit {
namespace http {

/**
 * First pipeline stage of an HTTP client channel.
 *
 * Decodes response bytes into HttpResponseHead, HttpContent and
 * HttpLastContent. Informational responses other than 101 are dropped.
 * Once a protocol upgrade is accepted every later byte is passed on
 * untouched as a BytesMessage.
 */
class HttpClientCodec : public network::ReadFilter,
                        public ResponseParserCallbacks {
 public:
  static constexpr const char* kName = "http_codec";

  HttpClientCodec();

  // ReadFilter
  void initializeReadFilterCallbacks(
      network::ReadFilterCallbacks& callbacks) override {
    callbacks_ = &callbacks;
  }
  void onRead(network::MessagePtr message) override;
  void onChannelInactive() override;

  // The next response answers a request with this method
  void expectResponseTo(HttpMethod method) { expected_method_ = method; }

  bool upgraded() const { return upgraded_; }

  // Request line and headers, terminated by an empty line
  static std::string encodeRequestHead(HttpMethod method,
                                       const std::string& uri,
                                       HttpVersion version,
                                       const HttpHeaders& headers);

  // ResponseParserCallbacks
  ParserCallbackResult onMessageBegin() override;
  ParserCallbackResult onStatus(const char* data, size_t length) override;
  ParserCallbackResult onHeaderField(const char* data, size_t length) override;
  ParserCallbackResult onHeaderValue(const char* data, size_t length) override;
  ParserCallbackResult onHeadersComplete() override;
  ParserCallbackResult onBody(const char* data, size_t length) override;
  ParserCallbackResult onMessageComplete() override;
  void onError(const std::string& error) override;

 private:
  void decode(const char* data, size_t length);
  void flushHeader();
  void flushOutput();

  network::ReadFilterCallbacks* callbacks_{nullptr};
  ResponseParserPtr parser_;
  HttpMethod expected_method_{HttpMethod::GET};

  std::unique_ptr<HttpResponseHead> head_;
  std::string header_field_;
  std::string header_value_;
  bool reading_value_{false};
  bool skip_message_{false};
  bool failed_{false};
  bool upgraded_{false};

  // Decoded messages are fired once the parser has returned
  std::vector<network::MessagePtr> output_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_CLIENT_CODEC_H
