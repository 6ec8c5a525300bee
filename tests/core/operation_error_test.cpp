#include "core/errors/exit_codes.hpp"
#include "core/errors/operation_error.hpp"

#include <catch2/catch_test_macros.hpp>

using scenevault::core::errors::ErrorKind;
using scenevault::core::errors::ExitCode;
using scenevault::core::errors::OperationError;

TEST_CASE("Every error kind maps to a stable code and exit code", "[core][errors]") {
  using scenevault::core::errors::ToExitCode;
  using scenevault::core::errors::ToStableErrorCode;

  REQUIRE(ToStableErrorCode(ErrorKind::kNotFound) == "NOT_FOUND");
  REQUIRE(ToStableErrorCode(ErrorKind::kStoreUnavailable) == "STORE_UNAVAILABLE");
  REQUIRE(ToStableErrorCode(ErrorKind::kInvalidCheckpointOrder) == "INVALID_CHECKPOINT_ORDER");
  REQUIRE(ToStableErrorCode(ErrorKind::kProjectTerminated) == "PROJECT_TERMINATED");
  REQUIRE(ToStableErrorCode(ErrorKind::kInvalidArgument) == "INVALID_ARGUMENT");

  REQUIRE(ToExitCode(ErrorKind::kNone) == ExitCode::kSuccess);
  REQUIRE(ToExitCode(ErrorKind::kNotFound) == ExitCode::kNotFound);
  REQUIRE(ToExitCode(ErrorKind::kProjectTerminated) == ExitCode::kProjectTerminated);
  REQUIRE(ToExitCode(ErrorKind::kInvalidCheckpointOrder) == ExitCode::kInvalidCheckpointOrder);
  REQUIRE(ToExitCode(ErrorKind::kInvalidArgument) == ExitCode::kInvalidArgument);
  REQUIRE(ToExitCode(ErrorKind::kStoreUnavailable) == ExitCode::kStoreUnavailable);

  REQUIRE(scenevault::core::errors::ToInt(ExitCode::kNotFound) == 40);
  REQUIRE(scenevault::core::errors::ToInt(ExitCode::kStoreUnavailable) == 50);
}

TEST_CASE("OperationError formats as code plus message", "[core][errors]") {
  OperationError error;
  REQUIRE(error.Is(ErrorKind::kNone));

  error.Set(ErrorKind::kNotFound, "project not found: p1");
  REQUIRE(scenevault::core::errors::FormatOperationError(error) ==
          "NOT_FOUND: project not found: p1");

  error.Clear();
  REQUIRE(error.kind == ErrorKind::kNone);
  REQUIRE(error.message.empty());
}
