#pragma once

#include <optional>
#include <string>
#include <utility>

namespace twsgate {
namespace domain {

enum class ErrorKind {
  NotConnected,          // Call made while the session is not Connected
  ConnectionLost,        // Connection dropped while the request was in flight
  Timeout,               // No terminating callback before the deadline
  RequestFailed,         // Gateway reported the id can never complete
  NoSecurityDefinition,  // Code 200
  PermissionDenied,      // Market data subscription missing
  InvalidArgument,       // Rejected locally before any wire traffic
};

const char* toString(ErrorKind kind);

struct SessionError {
  ErrorKind kind{ErrorKind::RequestFailed};
  int code{0};  // Gateway error code, 0 for locally raised errors
  std::string message;
};

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
// @brief  Value-or-error return for every blocking facade call.
//
// @details
// Callers inside the trading loop must never see an exception from a data
// fetch or order placement, so failures travel as data. ok() is true iff
// value holds something; error is meaningful only when !ok().
// -----------------------------------------------------------------------------
template <typename T>
struct Result {
  std::optional<T> value;
  SessionError error;

  bool ok() const { return value.has_value(); }
  explicit operator bool() const { return ok(); }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(SessionError e) {
    Result r;
    r.error = std::move(e);
    return r;
  }

  static Result failure(ErrorKind kind, std::string message, int code = 0) {
    return failure(SessionError{kind, code, std::move(message)});
  }
};

}  // namespace domain
}  // namespace twsgate
