#pragma once

#include <string>
#include <string_view>
#include <utility>

namespace warehouse::model {

/*
  Outcome of a core allocation / loading operation.

  Every failure here is local to one package or one call;
  callers report it and carry on.
*/

enum class ErrorCode {
  OK = 0,

  NoSuitableBin,
  CapacityExceeded,
  EmptyStack,
  EventSinkFailure,

  UnknownBin,
  InvalidArgument
};

constexpr std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NoSuitableBin:
      return "no_suitable_bin";
    case ErrorCode::CapacityExceeded:
      return "capacity_exceeded";
    case ErrorCode::EmptyStack:
      return "empty_stack";
    case ErrorCode::EventSinkFailure:
      return "event_sink_failure";
    case ErrorCode::UnknownBin:
      return "unknown_bin";
    case ErrorCode::InvalidArgument:
      return "invalid_argument";
  }
  return "unknown";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }
};

} // namespace warehouse::model
