#pragma once

namespace packforge::core::errors {

// Stable process-exit contract for CLI and CI automation.
//
// 0/1/2 keep their conventional meanings (success, generic failure, usage).
// The remaining values classify why a compile failed so wrappers can branch
// without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kSchemaInvalid = 10,
  kDecodeFailed = 11,
  kDuplicateKey = 12,
  kStoreFailed = 20,
  kSourceUnavailable = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace packforge::core::errors
