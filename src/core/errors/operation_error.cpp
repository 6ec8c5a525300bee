#include "core/errors/operation_error.hpp"

namespace scenevault::core::errors {

std::string_view ToStableErrorCode(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "OK";
  case ErrorKind::kNotFound:
    return "NOT_FOUND";
  case ErrorKind::kStoreUnavailable:
    return "STORE_UNAVAILABLE";
  case ErrorKind::kInvalidCheckpointOrder:
    return "INVALID_CHECKPOINT_ORDER";
  case ErrorKind::kProjectTerminated:
    return "PROJECT_TERMINATED";
  case ErrorKind::kInvalidArgument:
    return "INVALID_ARGUMENT";
  }
  return "UNKNOWN";
}

ExitCode ToExitCode(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return ExitCode::kSuccess;
  case ErrorKind::kNotFound:
    return ExitCode::kNotFound;
  case ErrorKind::kStoreUnavailable:
    return ExitCode::kStoreUnavailable;
  case ErrorKind::kInvalidCheckpointOrder:
    return ExitCode::kInvalidCheckpointOrder;
  case ErrorKind::kProjectTerminated:
    return ExitCode::kProjectTerminated;
  case ErrorKind::kInvalidArgument:
    return ExitCode::kInvalidArgument;
  }
  return ExitCode::kFailure;
}

std::string FormatOperationError(const OperationError& error) {
  std::string text(ToStableErrorCode(error.kind));
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

} // namespace scenevault::core::errors
