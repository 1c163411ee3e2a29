#ifndef CONDUIT_CORE_RESULT_H
#define CONDUIT_CORE_RESULT_H

#include <string>
#include <utility>

#include "conduit/core/compat.h"

namespace conduit {

// Error value carried through results, sinks and callbacks.
// status and location are filled by the HTTP layer.
struct Error {
  int code{0};
  std::string message;
  optional<int> status;
  optional<std::string> location;

  Error() = default;
  Error(int c, const std::string& m) : code(c), message(m) {}
};

template <typename T>
using Result = variant<T, Error>;

using VoidResult = Result<std::nullptr_t>;

inline VoidResult makeVoidSuccess() { return VoidResult(nullptr); }

inline VoidResult makeVoidError(const Error& error) {
  return VoidResult(error);
}

template <typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
  return Result<std::decay_t<T>>(std::forward<T>(value));
}

template <typename T>
Result<T> makeError(const Error& error) {
  return Result<T>(error);
}

template <typename T>
Result<T> makeError(int code, const std::string& message) {
  return Result<T>(Error(code, message));
}

template <typename T>
bool is_success(const Result<T>& result) {
  return holds_alternative<T>(result);
}

template <typename T>
bool is_error(const Result<T>& result) {
  return holds_alternative<Error>(result);
}

template <typename T>
const T* get_value(const Result<T>& result) {
  return get_if<T>(&result);
}

template <typename T>
T* get_value(Result<T>& result) {
  return get_if<T>(&result);
}

template <typename T>
const Error* get_error(const Result<T>& result) {
  return get_if<Error>(&result);
}

}  // namespace conduit

#endif  // CONDUIT_CORE_RESULT_H
