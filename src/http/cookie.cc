#include "conduit/http/cookie.h"

#include <cstdlib>

#include "conduit/http/http_headers.h"

namespace conduit {
namespace http {

namespace {

std::string stripQuotes(const std::string& value) {
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

}  // namespace

optional<Cookie> parseSetCookie(const std::string& header) {
  size_t semicolon = header.find(';');
  std::string pair = header.substr(0, semicolon);
  size_t equals = pair.find('=');
  if (equals == std::string::npos) {
    return nullopt;
  }
  Cookie cookie;
  cookie.name = trim(pair.substr(0, equals));
  cookie.value = stripQuotes(trim(pair.substr(equals + 1)));
  if (cookie.name.empty()) {
    return nullopt;
  }

  size_t pos = semicolon;
  while (pos != std::string::npos) {
    size_t next = header.find(';', pos + 1);
    std::string attribute = trim(header.substr(
        pos + 1, next == std::string::npos ? std::string::npos : next - pos - 1));
    pos = next;
    if (attribute.empty()) {
      continue;
    }

    size_t eq = attribute.find('=');
    std::string key = toLower(trim(attribute.substr(0, eq)));
    std::string value =
        eq == std::string::npos ? "" : trim(attribute.substr(eq + 1));

    if (key == "domain") {
      // A leading dot is ignored (RFC 6265 5.2.3)
      cookie.domain = toLower(!value.empty() && value[0] == '.'
                                  ? value.substr(1)
                                  : value);
    } else if (key == "path") {
      cookie.path = value;
    } else if (key == "max-age") {
      char* end = nullptr;
      long age = std::strtol(value.c_str(), &end, 10);
      if (end != value.c_str() && *end == '\0') {
        cookie.max_age = age;
      }
    } else if (key == "expires") {
      cookie.expires = value;
    } else if (key == "samesite") {
      cookie.same_site = value;
    } else if (key == "secure") {
      cookie.secure = true;
    } else if (key == "httponly") {
      cookie.http_only = true;
    }
  }
  return cookie;
}

std::string encodeClientCookie(const Cookie& cookie) {
  return cookie.name + "=" + cookie.value;
}

std::string encodeClientCookies(const std::vector<Cookie>& cookies) {
  std::string result;
  for (const auto& cookie : cookies) {
    if (!result.empty()) {
      result += "; ";
    }
    result += encodeClientCookie(cookie);
  }
  return result;
}

}  // namespace http
}  // namespace conduit
