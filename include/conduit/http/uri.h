#ifndef CONDUIT_HTTP_URI_H
#define CONDUIT_HTTP_URI_H

#include <cstdint>
#include <string>

#include "conduit/core/result.h"

namespace conduit {
namespace http {

/**
 * Absolute http/https/ws/wss target.
 *
 * Immutable; redirects produce new values through resolve().
 */
class Uri {
 public:
  Uri() = default;

  // Fails with InvalidUri for relative, malformed or unsupported targets
  static Result<Uri> parse(const std::string& text);

  static uint16_t defaultPort(const std::string& scheme);

  // Resolve a reference (absolute, network-path, absolute-path or
  // relative-path) against this URI
  Result<Uri> resolve(const std::string& reference) const;

  // Same target under another scheme; the port follows the scheme's
  // default unless it was given explicitly
  Uri withScheme(const std::string& scheme) const;

  const std::string& scheme() const { return scheme_; }
  const std::string& host() const { return host_; }
  uint16_t port() const { return port_; }
  bool hasExplicitPort() const { return explicit_port_; }
  const std::string& path() const { return path_; }
  const std::string& query() const { return query_; }
  bool hasQuery() const { return has_query_; }

  // https or wss
  bool secure() const;
  bool isWebSocket() const;

  // "/path?query"
  std::string pathAndQuery() const;

  // host, with ":port" when it is not the scheme default
  std::string authority() const;

  std::string toString() const;

  bool operator==(const Uri& rhs) const {
    return toString() == rhs.toString();
  }

 private:
  std::string scheme_;
  std::string host_;
  uint16_t port_{0};
  bool explicit_port_{false};
  std::string path_{"/"};
  std::string query_;
  bool has_query_{false};
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_URI_H
