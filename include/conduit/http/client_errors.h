#ifndef CONDUIT_HTTP_CLIENT_ERRORS_H
#define CONDUIT_HTTP_CLIENT_ERRORS_H

#include <stdexcept>
#include <string>

#include "conduit/core/result.h"

namespace conduit {
namespace http {

/**
 * Error codes carried in Error::code by the HTTP client.
 */
enum class ClientErrorCode : int {
  // Header or cookie mutation after the request head was committed
  HeaderLocked = 1000,
  // 3xx with Location while redirects are followed; consumed by the
  // redirect bridge, never surfaced unless it is the last word
  Redirect,
  HttpStatus,
  ConnectFailure,
  ConnectionClosed,
  UpgradeTooLate,
  UpgradeConflict,
  UpgradeFailed,
  NotActive,
  UnsupportedVersion,
  InvalidUri,
  ProtocolError,
  Timeout,
  // The request handler threw
  HandlerError,
};

const char* clientErrorCodeName(ClientErrorCode code);

inline int toInt(ClientErrorCode code) { return static_cast<int>(code); }

inline bool hasCode(const Error& error, ClientErrorCode code) {
  return error.code == toInt(code);
}

inline bool isRedirect(const Error& error) {
  return hasCode(error, ClientErrorCode::Redirect);
}

Error clientError(ClientErrorCode code, const std::string& message);

Error redirectError(int status, const std::string& location);

Error httpStatusError(int status, const std::string& reason);

Error connectFailure(const std::string& message);

Error connectionClosed();

/**
 * Thrown synchronously by request mutators once the headers are sent.
 */
class ClientException : public std::runtime_error {
 public:
  explicit ClientException(const Error& error)
      : std::runtime_error(error.message), error_(error) {}

  const Error& error() const { return error_; }
  ClientErrorCode code() const {
    return static_cast<ClientErrorCode>(error_.code);
  }

 private:
  Error error_;
};

}  // namespace http
}  // namespace conduit

#endif  // CONDUIT_HTTP_CLIENT_ERRORS_H
