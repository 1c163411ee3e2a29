#ifndef CONDUIT_HTTP_LLHTTP_PARSER_H
#define CONDUIT_HTTP_LLHTTP_PARSER_H

#include <memory>

#include "conduit/http/http_parser.h"

// llhttp.h stays out of public headers
typedef struct llhttp__internal_s llhttp_t;
typedef struct llhttp_settings_s llhttp_settings_t;

namespace conduit {
namespace http {

// ResponseParser on llhttp. One per connection; not thread-safe.
class LlhttpResponseParser : public ResponseParser {
 public:
  explicit LlhttpResponseParser(ResponseParserCallbacks* callbacks);
  ~LlhttpResponseParser() override;

  size_t execute(const char* data, size_t length) override;
  ParserStatus finish() override;
  ParserStatus getStatus() const override { return status_; }
  std::string getError() const override { return error_; }
  int statusCode() const override;
  uint8_t httpMajor() const override;
  uint8_t httpMinor() const override;
  bool shouldKeepAlive() const override;
  bool isUpgrade() const override;

 private:
  static LlhttpResponseParser* from(llhttp_t* parser);
  static int toLlhttp(ParserCallbackResult result);
  void setError(int err);

  std::unique_ptr<llhttp_t> parser_;
  std::unique_ptr<llhttp_settings_t> settings_;
  ResponseParserCallbacks* callbacks_;
  ParserStatus status_{ParserStatus::Ok};
  std::string error_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_LLHTTP_PARSER_H
