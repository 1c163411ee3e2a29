#include "conduit/http/client_errors.h"

namespace conduit {
namespace http {

const char* clientErrorCodeName(ClientErrorCode code) {
  switch (code) {
    case ClientErrorCode::HeaderLocked:
      return "HeaderLocked";
    case ClientErrorCode::Redirect:
      return "Redirect";
    case ClientErrorCode::HttpStatus:
      return "HttpStatus";
    case ClientErrorCode::ConnectFailure:
      return "ConnectFailure";
    case ClientErrorCode::ConnectionClosed:
      return "ConnectionClosed";
    case ClientErrorCode::UpgradeTooLate:
      return "UpgradeTooLate";
    case ClientErrorCode::UpgradeConflict:
      return "UpgradeConflict";
    case ClientErrorCode::UpgradeFailed:
      return "UpgradeFailed";
    case ClientErrorCode::NotActive:
      return "NotActive";
    case ClientErrorCode::UnsupportedVersion:
      return "UnsupportedVersion";
    case ClientErrorCode::InvalidUri:
      return "InvalidUri";
    case ClientErrorCode::ProtocolError:
      return "ProtocolError";
    case ClientErrorCode::Timeout:
      return "Timeout";
    case ClientErrorCode::HandlerError:
      return "HandlerError";
  }
  return "Unknown";
}

Error clientError(ClientErrorCode code, const std::string& message) {
  return Error(toInt(code), message);
}

Error redirectError(int status, const std::string& location) {
  Error error(toInt(ClientErrorCode::Redirect),
              "Redirect (" + std::to_string(status) + ") to " + location);
  error.status = status;
  error.location = location;
  return error;
}

Error httpStatusError(int status, const std::string& reason) {
  std::string message = "HTTP request failed with code: " +
                        std::to_string(status);
  if (!reason.empty()) {
    message += " " + reason;
  }
  Error error(toInt(ClientErrorCode::HttpStatus), message);
  error.status = status;
  return error;
}

Error connectFailure(const std::string& message) {
  return Error(toInt(ClientErrorCode::ConnectFailure), message);
}

Error connectionClosed() {
  return Error(toInt(ClientErrorCode::ConnectionClosed),
               "Connection closed before a response was received");
}

}  // namespace http
}  // namespace conduit
