#include "conduit/http/http_client_codec.h"

#include "conduit/http/llhttp_parser.h"

#define CONDUIT_LOG_COMPONENT "http.codec"
#include "conduit/logging/log_macros.h"

namespace conduit {
namespace http {

HttpClientCodec::HttpClientCodec()
    : parser_(createResponseParser(this)) {}

std::string HttpClientCodec::encodeRequestHead(HttpMethod method,
                                               const std::string& uri,
                                               HttpVersion version,
                                               const HttpHeaders& headers) {
  std::string head;
  head.reserve(256);
  head += httpMethodToString(method);
  head += ' ';
  head += uri.empty() ? "/" : uri;
  head += ' ';
  head += httpVersionToString(version);
  head += "\r\n";
  for (const auto& entry : headers) {
    head += entry.first;
    head += ": ";
    head += entry.second;
    head += "\r\n";
  }
  head += "\r\n";
  return head;
}

void HttpClientCodec::onRead(network::MessagePtr message) {
  auto* bytes = dynamic_cast<network::BytesMessage*>(message.get());
  if (!bytes || upgraded_) {
    callbacks_->fireRead(std::move(message));
    return;
  }
  if (failed_) {
    return;
  }

  OwnedBuffer& data = bytes->data();
  size_t length = data.length();
  const char* raw = static_cast<const char*>(data.linearize(length));
  decode(raw, length);
}

void HttpClientCodec::decode(const char* data, size_t length) {
  size_t consumed = parser_->execute(data, length);
  ParserStatus status = parser_->getStatus();

  if (status == ParserStatus::Upgraded) {
    upgraded_ = true;
    CONDUIT_LOG_DEBUG("protocol upgraded, {} trailing bytes",
                      length - consumed);
  }
  flushOutput();

  if (upgraded_ && consumed < length) {
    callbacks_->fireRead(std::make_unique<network::BytesMessage>(
        std::string(data + consumed, length - consumed)));
  }
}

void HttpClientCodec::onChannelInactive() {
  if (upgraded_ || failed_) {
    return;
  }
  // Completes bodies delimited by the connection closing
  parser_->finish();
  flushOutput();
}

void HttpClientCodec::flushOutput() {
  std::vector<network::MessagePtr> output;
  output.swap(output_);
  for (auto& message : output) {
    callbacks_->fireRead(std::move(message));
  }
}

ParserCallbackResult HttpClientCodec::onMessageBegin() {
  head_ = std::make_unique<HttpResponseHead>();
  header_field_.clear();
  header_value_.clear();
  reading_value_ = false;
  skip_message_ = false;
  return ParserCallbackResult::Success;
}

ParserCallbackResult HttpClientCodec::onStatus(const char* data,
                                               size_t length) {
  head_->reason.append(data, length);
  return ParserCallbackResult::Success;
}

ParserCallbackResult HttpClientCodec::onHeaderField(const char* data,
                                                    size_t length) {
  if (reading_value_) {
    flushHeader();
  }
  header_field_.append(data, length);
  return ParserCallbackResult::Success;
}

ParserCallbackResult HttpClientCodec::onHeaderValue(const char* data,
                                                    size_t length) {
  reading_value_ = true;
  header_value_.append(data, length);
  return ParserCallbackResult::Success;
}

void HttpClientCodec::flushHeader() {
  if (!header_field_.empty()) {
    head_->headers.add(header_field_, trim(header_value_));
  }
  header_field_.clear();
  header_value_.clear();
  reading_value_ = false;
}

ParserCallbackResult HttpClientCodec::onHeadersComplete() {
  flushHeader();
  head_->status = parser_->statusCode();
  head_->version_major = parser_->httpMajor();
  head_->version_minor = parser_->httpMinor();
  head_->keep_alive = parser_->shouldKeepAlive();
  head_->upgrade = head_->status == 101 && parser_->isUpgrade();

  if (head_->status >= 100 && head_->status < 200 && head_->status != 101) {
    CONDUIT_LOG_DEBUG("dropping informational response {}", head_->status);
    skip_message_ = true;
    return ParserCallbackResult::Success;
  }

  bool no_body = expected_method_ == HttpMethod::HEAD;
  output_.push_back(std::move(head_));
  return no_body ? ParserCallbackResult::NoBody
                 : ParserCallbackResult::Success;
}

ParserCallbackResult HttpClientCodec::onBody(const char* data, size_t length) {
  if (skip_message_) {
    return ParserCallbackResult::Success;
  }
  if (!output_.empty()) {
    auto* last = dynamic_cast<HttpContent*>(output_.back().get());
    if (last && !dynamic_cast<HttpLastContent*>(last)) {
      last->data.append(data, length);
      return ParserCallbackResult::Success;
    }
  }
  output_.push_back(std::make_unique<HttpContent>(std::string(data, length)));
  return ParserCallbackResult::Success;
}

ParserCallbackResult HttpClientCodec::onMessageComplete() {
  if (skip_message_) {
    skip_message_ = false;
    return ParserCallbackResult::Success;
  }
  output_.push_back(std::make_unique<HttpLastContent>());
  return ParserCallbackResult::Success;
}

void HttpClientCodec::onError(const std::string& error) {
  failed_ = true;
  CONDUIT_LOG_DEBUG("response decoding failed: {}", error);
  output_.push_back(std::make_unique<HttpDecoderFailure>(error));
}

}  // namespace http
}  // namespace conduit
