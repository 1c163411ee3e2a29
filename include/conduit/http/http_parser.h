#ifndef CONDUIT_HTTP_HTTP_PARSER_H
#define CONDUIT_HTTP_HTTP_PARSER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace conduit {
namespace http {

enum class HttpMethod {
  GET,
  POST,
  PUT,
  DELETE,
  HEAD,
  OPTIONS,
  PATCH,
  CONNECT,
  TRACE,
  UNKNOWN
};

// Only HTTP/1.x is spoken; anything else maps to UNKNOWN
enum class HttpVersion { HTTP_1_0, HTTP_1_1, UNKNOWN };

const char* httpMethodToString(HttpMethod method);

// "HTTP/1.1"
const char* httpVersionToString(HttpVersion version);
HttpVersion httpVersionFromNumbers(uint8_t major, uint8_t minor);

enum class ParserCallbackResult {
  Success = 0,
  Error = -1,
  // From onHeadersComplete only: the message has no body (HEAD responses)
  NoBody = 2
};

enum class ParserStatus {
  Ok,
  Error,
  // A protocol upgrade completed; bytes after it belong to the new protocol
  Upgraded
};

class ResponseParser;
using ResponseParserPtr = std::unique_ptr<ResponseParser>;

/**
 * Receives the pieces of a response as they are decoded.
 *
 * Field and value callbacks may arrive split across several calls when the
 * input is split; a field ends when the first value callback for it arrives.
 */
class ResponseParserCallbacks {
 public:
  virtual ~ResponseParserCallbacks() = default;

  virtual ParserCallbackResult onMessageBegin() = 0;
  virtual ParserCallbackResult onStatus(const char* data, size_t length) = 0;
  virtual ParserCallbackResult onHeaderField(const char* data,
                                             size_t length) = 0;
  virtual ParserCallbackResult onHeaderValue(const char* data,
                                             size_t length) = 0;
  virtual ParserCallbackResult onHeadersComplete() = 0;
  virtual ParserCallbackResult onBody(const char* data, size_t length) = 0;
  virtual ParserCallbackResult onMessageComplete() = 0;
  virtual void onError(const std::string& error) = 0;
};

/**
 * Incremental HTTP/1.x response decoder.
 *
 * Once an error is reported nothing more is consumed.
 */
class ResponseParser {
 public:
  virtual ~ResponseParser() = default;

  // Returns bytes consumed. After an upgrade this is the offset of the
  // first byte that belongs to the upgraded protocol.
  virtual size_t execute(const char* data, size_t length) = 0;

  // End of input. Completes a close-delimited body; an error if a message
  // was cut short.
  virtual ParserStatus finish() = 0;

  virtual ParserStatus getStatus() const = 0;
  virtual std::string getError() const = 0;

  // Valid from onHeadersComplete on
  virtual int statusCode() const = 0;
  virtual uint8_t httpMajor() const = 0;
  virtual uint8_t httpMinor() const = 0;
  virtual bool shouldKeepAlive() const = 0;
  virtual bool isUpgrade() const = 0;
};

ResponseParserPtr createResponseParser(ResponseParserCallbacks* callbacks);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_HTTP_PARSER_H
