#ifndef CONDUIT_HTTP_COOKIE_H
#define CONDUIT_HTTP_COOKIE_H

#include <map>
#include <string>
#include <vector>

#include "conduit/core/compat.h"

namespace conduit {
namespace http {

struct Cookie {
  std::string name;
  std::string value;
  std::string domain;
  std::string path;
  optional<long> max_age;
  std::string expires;
  std::string same_site;
  bool secure{false};
  bool http_only{false};

  Cookie() = default;
  Cookie(std::string n, std::string v)
      : name(std::move(n)), value(std::move(v)) {}
};

// Cookies by name, each name keeping every value received for it
using CookieMap = std::map<std::string, std::vector<Cookie>>;

// Parses one Set-Cookie header value; nullopt if it carries no name=value
optional<Cookie> parseSetCookie(const std::string& header);

// "a=1; b=2" for a request Cookie header
std::string encodeClientCookies(const std::vector<Cookie>& cookies);

std::string encodeClientCookie(const Cookie& cookie);

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_COOKIE_H
