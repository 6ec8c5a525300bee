#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace scenevault::core::errors {

// Closed failure taxonomy for store and recovery operations.
//
// - kNotFound / kProjectTerminated are expected, caller-recoverable outcomes
// - kStoreUnavailable is transient persistence trouble; writers retry it
// - kInvalidCheckpointOrder means a writer broke the ordering contract
// - kInvalidArgument rejects malformed requests before any state is touched
enum class ErrorKind {
  kNone,
  kNotFound,
  kStoreUnavailable,
  kInvalidCheckpointOrder,
  kProjectTerminated,
  kInvalidArgument,
};

// Grep-friendly code used in log fields and CLI stderr.
std::string_view ToStableErrorCode(ErrorKind kind);

ExitCode ToExitCode(ErrorKind kind);

// Error out-parameter filled by every fallible store/recovery call.
struct OperationError {
  ErrorKind kind = ErrorKind::kNone;
  std::string message;

  void Set(ErrorKind new_kind, std::string new_message) {
    kind = new_kind;
    message = std::move(new_message);
  }

  void Clear() {
    kind = ErrorKind::kNone;
    message.clear();
  }

  bool Is(ErrorKind expected) const {
    return kind == expected;
  }
};

// Single-line form "<STABLE_CODE>: <message>".
std::string FormatOperationError(const OperationError& error);

} // namespace scenevault::core::errors
