#pragma once

namespace coresidency::core::errors {

// Stable process-exit contract for the `coresidency` CLI.
//
// - 0 success
// - 1 generic command failure
// - 2 usage/argument failure
//
// Additional values classify detector failures so wrappers can branch without
// scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigurationInvalid = 10,
  kBatchRejected = 20,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace coresidency::core::errors
