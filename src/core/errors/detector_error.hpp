#pragma once

#include <string>
#include <string_view>

namespace coresidency::core::errors {

// Stable classification for failures surfaced by the detection pipeline.
//
// - kConfigurationMismatch: a sample reports a metric that has no configured
//   threshold while mitigation is enabled.
// - kMalformedConfiguration: configuration text is unreadable, not JSON, or
//   violates the schema. The previously active configuration stays in force.
// - kInvalidSampleBatch: a batch is structurally unusable (missing Activity,
//   heterogeneous metric keys, non-finite values). Rejected before mutation.
enum class DetectorErrorCode {
  kNone,
  kConfigurationMismatch,
  kMalformedConfiguration,
  kInvalidSampleBatch,
};

std::string_view ToStableErrorCode(DetectorErrorCode code);

struct DetectorError {
  DetectorErrorCode code = DetectorErrorCode::kNone;
  std::string message;

  // Offending metric or host when the failure is tied to one.
  std::string subject;

  void Clear() {
    code = DetectorErrorCode::kNone;
    message.clear();
    subject.clear();
  }

  bool ok() const {
    return code == DetectorErrorCode::kNone;
  }
};

// Fills `error` and returns false so call sites can `return Fail(...)`.
bool SetDetectorError(DetectorError& error, DetectorErrorCode code, std::string message,
                      std::string subject = {});

// Returns single-line contract text:
//   "<STABLE_CODE>: <message>"
std::string FormatDetectorError(const DetectorError& error);

} // namespace coresidency::core::errors
