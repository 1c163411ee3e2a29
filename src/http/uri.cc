#include "conduit/http/uri.h"

#include <cctype>
#include <vector>

#include "conduit/http/client_errors.h"
#include "conduit/http/http_headers.h"

namespace conduit {
namespace http {

namespace {

Result<Uri> invalid(const std::string& text, const std::string& why) {
  return makeError<Uri>(
      clientError(ClientErrorCode::InvalidUri, "Invalid URI '" + text + "': " + why));
}

bool isSupportedScheme(const std::string& scheme) {
  return scheme == "http" || scheme == "https" || scheme == "ws" ||
         scheme == "wss";
}

// RFC 3986 section 5.2.4
std::string removeDotSegments(const std::string& path) {
  std::vector<std::string> output;
  size_t pos = 0;
  bool trailing_slash = false;
  while (pos < path.size()) {
    size_t next = path.find('/', pos);
    std::string segment = path.substr(
        pos, next == std::string::npos ? std::string::npos : next - pos);
    trailing_slash = next != std::string::npos && next + 1 == path.size();
    if (segment == "..") {
      if (!output.empty()) {
        output.pop_back();
      }
      trailing_slash = true;
    } else if (segment == ".") {
      trailing_slash = true;
    } else if (!segment.empty()) {
      output.push_back(segment);
    }
    if (next == std::string::npos) {
      break;
    }
    pos = next + 1;
  }

  std::string result;
  for (const auto& segment : output) {
    result += "/" + segment;
  }
  if (result.empty() || (trailing_slash && result.back() != '/')) {
    result += "/";
  }
  return result;
}

// Scheme per RFC 3986: ALPHA *( ALPHA / DIGIT / "+" / "-" / "." ) ":"
bool hasScheme(const std::string& text) {
  size_t colon = text.find(':');
  if (colon == std::string::npos || colon == 0) {
    return false;
  }
  if (!std::isalpha(static_cast<unsigned char>(text[0]))) {
    return false;
  }
  for (size_t i = 1; i < colon; ++i) {
    char c = text[i];
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' &&
        c != '.') {
      return false;
    }
  }
  return true;
}

}  // namespace

uint16_t Uri::defaultPort(const std::string& scheme) {
  return (scheme == "https" || scheme == "wss") ? 443 : 80;
}

Result<Uri> Uri::parse(const std::string& text) {
  size_t scheme_end = text.find("://");
  if (scheme_end == std::string::npos || scheme_end == 0) {
    return invalid(text, "not an absolute URI");
  }

  Uri uri;
  uri.scheme_ = toLower(text.substr(0, scheme_end));
  if (!isSupportedScheme(uri.scheme_)) {
    return invalid(text, "unsupported scheme " + uri.scheme_);
  }

  size_t authority_start = scheme_end + 3;
  size_t authority_end = text.find_first_of("/?#", authority_start);
  std::string authority = text.substr(
      authority_start, authority_end == std::string::npos
                           ? std::string::npos
                           : authority_end - authority_start);

  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    authority = authority.substr(at + 1);
  }
  if (authority.empty()) {
    return invalid(text, "missing host");
  }

  std::string port_text;
  if (authority[0] == '[') {
    size_t close = authority.find(']');
    if (close == std::string::npos) {
      return invalid(text, "unterminated IPv6 literal");
    }
    uri.host_ = authority.substr(1, close - 1);
    if (close + 1 < authority.size()) {
      if (authority[close + 1] != ':') {
        return invalid(text, "malformed authority");
      }
      port_text = authority.substr(close + 2);
    }
  } else {
    size_t colon = authority.find(':');
    uri.host_ = authority.substr(0, colon);
    if (colon != std::string::npos) {
      port_text = authority.substr(colon + 1);
    }
  }
  if (uri.host_.empty()) {
    return invalid(text, "missing host");
  }
  uri.host_ = toLower(uri.host_);

  uri.port_ = defaultPort(uri.scheme_);
  if (!port_text.empty()) {
    if (port_text.size() > 5) {
      return invalid(text, "port out of range");
    }
    unsigned long port = 0;
    for (char c : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(c))) {
        return invalid(text, "non-numeric port");
      }
      port = port * 10 + static_cast<unsigned long>(c - '0');
    }
    if (port == 0 || port > 65535) {
      return invalid(text, "port out of range");
    }
    uri.port_ = static_cast<uint16_t>(port);
    uri.explicit_port_ = true;
  }

  if (authority_end != std::string::npos) {
    std::string rest = text.substr(authority_end);
    size_t hash = rest.find('#');
    if (hash != std::string::npos) {
      rest = rest.substr(0, hash);
    }
    size_t question = rest.find('?');
    std::string path = rest.substr(0, question);
    if (!path.empty()) {
      uri.path_ = path;
    }
    if (question != std::string::npos) {
      uri.query_ = rest.substr(question + 1);
      uri.has_query_ = true;
    }
  }
  return makeSuccess(std::move(uri));
}

Result<Uri> Uri::resolve(const std::string& reference) const {
  if (reference.empty()) {
    return makeSuccess(Uri(*this));
  }
  if (hasScheme(reference)) {
    return parse(reference);
  }
  if (reference.compare(0, 2, "//") == 0) {
    return parse(scheme_ + ":" + reference);
  }

  Uri result(*this);
  std::string ref = reference;
  size_t hash = ref.find('#');
  if (hash != std::string::npos) {
    ref = ref.substr(0, hash);
  }
  size_t question = ref.find('?');
  std::string ref_path = ref.substr(0, question);
  bool ref_has_query = question != std::string::npos;
  std::string ref_query = ref_has_query ? ref.substr(question + 1) : "";

  if (ref_path.empty()) {
    if (ref_has_query) {
      result.query_ = ref_query;
      result.has_query_ = true;
    }
    return makeSuccess(std::move(result));
  }

  if (ref_path[0] == '/') {
    result.path_ = removeDotSegments(ref_path);
  } else {
    size_t last_slash = path_.rfind('/');
    std::string base_dir =
        last_slash == std::string::npos ? "/" : path_.substr(0, last_slash + 1);
    result.path_ = removeDotSegments(base_dir + ref_path);
  }
  result.query_ = ref_query;
  result.has_query_ = ref_has_query;
  return makeSuccess(std::move(result));
}

Uri Uri::withScheme(const std::string& scheme) const {
  Uri result(*this);
  result.scheme_ = toLower(scheme);
  if (!explicit_port_) {
    result.port_ = defaultPort(result.scheme_);
  }
  return result;
}

bool Uri::secure() const { return scheme_ == "https" || scheme_ == "wss"; }

bool Uri::isWebSocket() const { return scheme_ == "ws" || scheme_ == "wss"; }

std::string Uri::pathAndQuery() const {
  return has_query_ ? path_ + "?" + query_ : path_;
}

std::string Uri::authority() const {
  std::string host =
      host_.find(':') != std::string::npos ? "[" + host_ + "]" : host_;
  if (port_ != defaultPort(scheme_)) {
    return host + ":" + std::to_string(port_);
  }
  return host;
}

std::string Uri::toString() const {
  return scheme_ + "://" + authority() + pathAndQuery();
}

}  // namespace http
}  // namespace conduit
