#include "conduit/http/llhttp_parser.h"

#include <llhttp.h>

namespace conduit {
namespace http {

const char* httpMethodToString(HttpMethod method) {
  switch (method) {
    case HttpMethod::GET:
      return "GET";
    case HttpMethod::POST:
      return "POST";
    case HttpMethod::PUT:
      return "PUT";
    case HttpMethod::DELETE:
      return "DELETE";
    case HttpMethod::HEAD:
      return "HEAD";
    case HttpMethod::OPTIONS:
      return "OPTIONS";
    case HttpMethod::PATCH:
      return "PATCH";
    case HttpMethod::CONNECT:
      return "CONNECT";
    case HttpMethod::TRACE:
      return "TRACE";
    default:
      return "UNKNOWN";
  }
}

const char* httpVersionToString(HttpVersion version) {
  switch (version) {
    case HttpVersion::HTTP_1_0:
      return "HTTP/1.0";
    case HttpVersion::HTTP_1_1:
      return "HTTP/1.1";
    default:
      return "UNKNOWN";
  }
}

HttpVersion httpVersionFromNumbers(uint8_t major, uint8_t minor) {
  if (major != 1) {
    return HttpVersion::UNKNOWN;
  }
  if (minor == 0) {
    return HttpVersion::HTTP_1_0;
  }
  return minor == 1 ? HttpVersion::HTTP_1_1 : HttpVersion::UNKNOWN;
}

LlhttpResponseParser::LlhttpResponseParser(ResponseParserCallbacks* callbacks)
    : parser_(std::make_unique<llhttp_t>()),
      settings_(std::make_unique<llhttp_settings_t>()),
      callbacks_(callbacks) {
  llhttp_settings_init(settings_.get());

  settings_->on_message_begin = [](llhttp_t* p) {
    return toLlhttp(from(p)->callbacks_->onMessageBegin());
  };
  settings_->on_status = [](llhttp_t* p, const char* at, size_t length) {
    return toLlhttp(from(p)->callbacks_->onStatus(at, length));
  };
  settings_->on_header_field = [](llhttp_t* p, const char* at, size_t length) {
    return toLlhttp(from(p)->callbacks_->onHeaderField(at, length));
  };
  settings_->on_header_value = [](llhttp_t* p, const char* at, size_t length) {
    return toLlhttp(from(p)->callbacks_->onHeaderValue(at, length));
  };
  settings_->on_headers_complete = [](llhttp_t* p) {
    ParserCallbackResult result = from(p)->callbacks_->onHeadersComplete();
    // 1 tells llhttp that no body follows
    return result == ParserCallbackResult::NoBody ? 1 : toLlhttp(result);
  };
  settings_->on_body = [](llhttp_t* p, const char* at, size_t length) {
    return toLlhttp(from(p)->callbacks_->onBody(at, length));
  };
  settings_->on_message_complete = [](llhttp_t* p) {
    return toLlhttp(from(p)->callbacks_->onMessageComplete());
  };

  llhttp_init(parser_.get(), HTTP_RESPONSE, settings_.get());
  parser_->data = this;
}

LlhttpResponseParser::~LlhttpResponseParser() = default;

LlhttpResponseParser* LlhttpResponseParser::from(llhttp_t* parser) {
  return static_cast<LlhttpResponseParser*>(parser->data);
}

int LlhttpResponseParser::toLlhttp(ParserCallbackResult result) {
  return result == ParserCallbackResult::Error ? HPE_USER : HPE_OK;
}

size_t LlhttpResponseParser::execute(const char* data, size_t length) {
  if (status_ != ParserStatus::Ok) {
    return 0;
  }

  llhttp_errno_t err = llhttp_execute(parser_.get(), data, length);
  if (err == HPE_OK) {
    return length;
  }
  const char* stop = llhttp_get_error_pos(parser_.get());
  if (err == HPE_PAUSED_UPGRADE) {
    status_ = ParserStatus::Upgraded;
    return static_cast<size_t>(stop - data);
  }
  setError(err);
  return stop ? static_cast<size_t>(stop - data) : 0;
}

ParserStatus LlhttpResponseParser::finish() {
  if (status_ != ParserStatus::Ok) {
    return status_;
  }
  llhttp_errno_t err = llhttp_finish(parser_.get());
  if (err != HPE_OK) {
    setError(err);
  }
  return status_;
}

void LlhttpResponseParser::setError(int err) {
  status_ = ParserStatus::Error;
  error_ = std::string(llhttp_errno_name(static_cast<llhttp_errno_t>(err))) +
           ": " + llhttp_get_error_reason(parser_.get());
  callbacks_->onError(error_);
}

int LlhttpResponseParser::statusCode() const { return parser_->status_code; }

uint8_t LlhttpResponseParser::httpMajor() const { return parser_->http_major; }

uint8_t LlhttpResponseParser::httpMinor() const { return parser_->http_minor; }

bool LlhttpResponseParser::shouldKeepAlive() const {
  return llhttp_should_keep_alive(parser_.get()) != 0;
}

bool LlhttpResponseParser::isUpgrade() const { return parser_->upgrade != 0; }

ResponseParserPtr createResponseParser(ResponseParserCallbacks* callbacks) {
  return std::make_unique<LlhttpResponseParser>(callbacks);
}

}  // namespace http
}  // namespace conduit
