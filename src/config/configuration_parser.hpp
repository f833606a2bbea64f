#pragma once

#include "config/configuration.hpp"
#include "core/errors/detector_error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace coresidency::config {

struct ConfigurationIssue {
  std::string path;
  std::string message;
};

struct ConfigurationReport {
  bool valid = false;
  std::vector<ConfigurationIssue> issues;
};

// Checks the semantic constraints of an already-built configuration:
// positive hysteresis counts and window capacity, inclusion/exclusion gates of
// -1 or >= 1, finite non-negative thresholds, no threshold on Activity, and
// four non-empty, pairwise distinct event wire names.
//
// Populates `report.valid` and appends to `report.issues`.
void ValidateConfiguration(const Configuration& configuration, ConfigurationReport& report);

// Parses configuration JSON text (schema: Version, EnableMitigation,
// MitigationConfiguration, Thresholds, Performance, EventNames; every leaf
// under a `Value` key, `Description` siblings ignored) and validates it.
//
// Contract:
// - Returns true and fills `configuration` only when the report is valid.
// - On failure `configuration` is left untouched; issues carry the JSON path
//   (or `$` for parse errors).
bool ParseConfigurationText(std::string_view json_text, Configuration& configuration,
                            ConfigurationReport& report);

// Loads, parses and validates a configuration file.
//
// Contract:
// - true: `configuration` holds the parsed snapshot, `error` is cleared.
// - false: `error` is MALFORMED_CONFIGURATION. `report` lists schema issues
//   when the file could be read.
bool LoadConfigurationFile(const std::filesystem::path& path, Configuration& configuration,
                           ConfigurationReport& report, core::errors::DetectorError& error);

// "path: message; path: message" summary used in log lines and errors.
std::string SummarizeIssues(const ConfigurationReport& report);

} // namespace coresidency::config
