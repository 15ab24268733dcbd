#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace shipx::util {

/*
  Workflow result codes.

  Every step of the shipment workflow reports through these; the first
  non-OK result ends the run.
*/

enum class ErrorCode {
  kOk = 0,

  kConfiguration,

  kTransport,
  kProvider,
  kProtocol,

  kTimeout,
  kRejected,

  kIOError,
  kInternal
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kConfiguration:
      return "configuration";
    case ErrorCode::kTransport:
      return "transport";
    case ErrorCode::kProvider:
      return "provider";
    case ErrorCode::kProtocol:
      return "protocol";
    case ErrorCode::kTimeout:
      return "timeout";
    case ErrorCode::kRejected:
      return "rejected";
    case ErrorCode::kIOError:
      return "io_error";
    case ErrorCode::kInternal:
      return "internal";
  }
  return "internal";
}

struct Result {
  ErrorCode   code = ErrorCode::kOk;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  bool ok() const {
    return code == ErrorCode::kOk;
  }

  explicit operator bool() const {
    return ok();
  }
};

} // namespace shipx::util
