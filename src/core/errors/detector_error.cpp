#include "core/errors/detector_error.hpp"

#include <utility>

namespace coresidency::core::errors {

std::string_view ToStableErrorCode(const DetectorErrorCode code) {
  switch (code) {
  case DetectorErrorCode::kNone:
    return "OK";
  case DetectorErrorCode::kConfigurationMismatch:
    return "CONFIGURATION_MISMATCH";
  case DetectorErrorCode::kMalformedConfiguration:
    return "MALFORMED_CONFIGURATION";
  case DetectorErrorCode::kInvalidSampleBatch:
    return "INVALID_SAMPLE_BATCH";
  }

  return "UNKNOWN";
}

bool SetDetectorError(DetectorError& error, const DetectorErrorCode code, std::string message,
                      std::string subject) {
  error.code = code;
  error.message = std::move(message);
  error.subject = std::move(subject);
  return false;
}

std::string FormatDetectorError(const DetectorError& error) {
  std::string formatted(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    formatted += ": ";
    formatted += error.message;
  }
  return formatted;
}

} // namespace coresidency::core::errors
