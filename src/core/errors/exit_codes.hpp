#pragma once

namespace scenevault::core::errors {

// Stable process-exit contract for scripts driving the scenevault CLI.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values mirror the caller-facing status classes so wrappers can
// branch without scraping stderr:
// - 40 unknown project (404)
// - 41 project already Done/Cancelled (409)
// - 42 regressive checkpoint from a writer
// - 43 malformed request (400)
// - 50 persistence unavailable (5xx, retryable)
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kNotFound = 40,
  kProjectTerminated = 41,
  kInvalidCheckpointOrder = 42,
  kInvalidArgument = 43,
  kStoreUnavailable = 50,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace scenevault::core::errors
