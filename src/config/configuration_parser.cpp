#include "config/configuration_parser.hpp"

#include "core/json_dom.hpp"
#include "core/json_utils.hpp"
#include "metrics/metric_value.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <limits>
#include <set>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace coresidency::config {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kDescriptionKey = "Description";
constexpr std::string_view kLeafKey = "Value";

void AddIssue(ConfigurationReport& report, std::string path, std::string message) {
  report.issues.push_back({.path = std::move(path), .message = std::move(message)});
}

bool IsDescription(const std::string& key, const JsonValue& value) {
  return key == kDescriptionKey && value.is_string();
}

// Resolves a documented leaf: `{"Value": x, "Description": "..."}` yields x.
// A bare scalar is accepted as its own value.
const JsonValue* ResolveLeaf(const JsonValue& node, const std::string& path,
                             ConfigurationReport& report) {
  if (!node.is_object()) {
    return &node;
  }
  const JsonValue* leaf = core::json::FindMember(node, kLeafKey);
  if (leaf == nullptr) {
    AddIssue(report, path, "must contain a 'Value' key");
    return nullptr;
  }
  return leaf;
}

bool ReadBoolLeaf(const JsonValue& node, const std::string& path, bool& out,
                  ConfigurationReport& report) {
  const JsonValue* leaf = ResolveLeaf(node, path, report);
  if (leaf == nullptr) {
    return false;
  }
  if (!leaf->is_bool()) {
    AddIssue(report, path + ".Value",
             std::string("must be a bool (got ") + core::json::TypeName(leaf->type) + ")");
    return false;
  }
  out = leaf->bool_value;
  return true;
}

bool ReadIntLeaf(const JsonValue& node, const std::string& path, int& out,
                 ConfigurationReport& report) {
  const JsonValue* leaf = ResolveLeaf(node, path, report);
  if (leaf == nullptr) {
    return false;
  }
  std::int64_t parsed = 0;
  if (!core::json::TryGetInteger(*leaf, parsed) ||
      parsed < std::numeric_limits<int>::min() || parsed > std::numeric_limits<int>::max()) {
    AddIssue(report, path + ".Value", "must be an integer");
    return false;
  }
  out = static_cast<int>(parsed);
  return true;
}

bool ReadNumberLeaf(const JsonValue& node, const std::string& path, double& out,
                    ConfigurationReport& report) {
  const JsonValue* leaf = ResolveLeaf(node, path, report);
  if (leaf == nullptr) {
    return false;
  }
  if (!leaf->is_number()) {
    AddIssue(report, path + ".Value",
             std::string("must be a number (got ") + core::json::TypeName(leaf->type) + ")");
    return false;
  }
  out = leaf->number_value;
  return true;
}

bool ReadStringLeaf(const JsonValue& node, const std::string& path, std::string& out,
                    ConfigurationReport& report) {
  const JsonValue* leaf = ResolveLeaf(node, path, report);
  if (leaf == nullptr) {
    return false;
  }
  if (!leaf->is_string()) {
    AddIssue(report, path + ".Value",
             std::string("must be a string (got ") + core::json::TypeName(leaf->type) + ")");
    return false;
  }
  out = leaf->string_value;
  return true;
}

const JsonValue* RequireSection(const JsonValue& root, std::string_view key,
                                ConfigurationReport& report) {
  const JsonValue* section = core::json::FindMember(root, key);
  if (section == nullptr) {
    AddIssue(report, std::string(key), "is required");
    return nullptr;
  }
  if (!section->is_object()) {
    AddIssue(report, std::string(key), "must be an object");
    return nullptr;
  }
  return section;
}

void ParseVersion(const JsonValue& root, Configuration& configuration,
                  ConfigurationReport& report) {
  const JsonValue* node = core::json::FindMember(root, "Version");
  if (node == nullptr) {
    return;
  }
  const JsonValue* leaf = ResolveLeaf(*node, "Version", report);
  if (leaf == nullptr) {
    return;
  }
  if (leaf->is_string()) {
    configuration.version = leaf->string_value;
  } else if (leaf->is_number()) {
    configuration.version = core::FormatJsonNumber(leaf->number_value);
  } else {
    AddIssue(report, "Version", "must be a string or number");
  }
}

void ParseMitigation(const JsonValue& root, Configuration& configuration,
                     ConfigurationReport& report) {
  const JsonValue* enable = core::json::FindMember(root, "EnableMitigation");
  if (enable == nullptr) {
    AddIssue(report, "EnableMitigation", "is required");
    return;
  }
  (void)ReadBoolLeaf(*enable, "EnableMitigation", configuration.mitigation_enabled, report);

  const JsonValue* section = core::json::FindMember(root, "MitigationConfiguration");
  if (section == nullptr) {
    if (configuration.mitigation_enabled) {
      AddIssue(report, "MitigationConfiguration", "is required when EnableMitigation is true");
    }
    return;
  }
  if (!section->is_object()) {
    AddIssue(report, "MitigationConfiguration", "must be an object");
    return;
  }

  const JsonValue* flags = core::json::FindMember(*section, "FlagsBeforeActivation");
  if (flags == nullptr) {
    AddIssue(report, "MitigationConfiguration.FlagsBeforeActivation", "is required");
  } else {
    (void)ReadIntLeaf(*flags, "MitigationConfiguration.FlagsBeforeActivation",
                      configuration.flags_before_activation, report);
  }

  const JsonValue* deflags = core::json::FindMember(*section, "DeflagsBeforeDeactivation");
  if (deflags == nullptr) {
    AddIssue(report, "MitigationConfiguration.DeflagsBeforeDeactivation", "is required");
  } else {
    (void)ReadIntLeaf(*deflags, "MitigationConfiguration.DeflagsBeforeDeactivation",
                      configuration.deflags_before_deactivation, report);
  }
}

void ParseThresholds(const JsonValue& root, Configuration& configuration,
                     ConfigurationReport& report) {
  const JsonValue* section = RequireSection(root, "Thresholds", report);
  if (section == nullptr) {
    return;
  }

  for (const auto& [metric, node] : section->object_value) {
    if (IsDescription(metric, node)) {
      continue;
    }
    double bound = 0.0;
    if (ReadNumberLeaf(node, "Thresholds." + metric, bound, report)) {
      configuration.thresholds[metric] = bound;
    }
  }
}

void ParsePerformance(const JsonValue& root, Configuration& configuration,
                      ConfigurationReport& report) {
  const JsonValue* section = RequireSection(root, "Performance", report);
  if (section == nullptr) {
    return;
  }

  const auto read_int = [&](std::string_view key, int& target) {
    const std::string path = "Performance." + std::string(key);
    const JsonValue* node = core::json::FindMember(*section, key);
    if (node == nullptr) {
      AddIssue(report, path, "is required");
      return;
    }
    (void)ReadIntLeaf(*node, path, target, report);
  };

  read_int("SamplesBeforeInclusion", configuration.samples_before_inclusion);
  read_int("SamplesBeforeExclusion", configuration.samples_before_exclusion);
  read_int("MaxSamples", configuration.max_samples);

  const JsonValue* normalize = core::json::FindMember(*section, "NormalizeSamples");
  if (normalize == nullptr) {
    AddIssue(report, "Performance.NormalizeSamples", "is required");
  } else {
    (void)ReadBoolLeaf(*normalize, "Performance.NormalizeSamples",
                       configuration.normalize_samples, report);
  }

  static const std::set<std::string> kKnownKeys = {
      "SamplesBeforeInclusion", "SamplesBeforeExclusion", "NormalizeSamples", "MaxSamples"};
  for (const auto& [key, node] : section->object_value) {
    if (IsDescription(key, node) || kKnownKeys.count(key) != 0U) {
      continue;
    }
    AddIssue(report, "Performance." + key, "is not a recognized performance option");
  }
}

void ParseEventNames(const JsonValue& root, Configuration& configuration,
                     ConfigurationReport& report) {
  const JsonValue* section = core::json::FindMember(root, "EventNames");
  if (section == nullptr) {
    return;
  }
  if (!section->is_object()) {
    AddIssue(report, "EventNames", "must be an object");
    return;
  }

  for (const auto& [logical_name, node] : section->object_value) {
    if (IsDescription(logical_name, node)) {
      continue;
    }
    const std::string path = "EventNames." + logical_name;
    const WireNameField field = FindWireNameField(logical_name);
    if (field == nullptr) {
      AddIssue(report, path,
               "is not a recognized event (expected SampleEvent|StartMitigation|"
               "StopMitigation|ConfigurationReloaded)");
      continue;
    }
    (void)ReadStringLeaf(node, path, configuration.event_names.*field, report);
  }
}

void ValidateGate(int value, std::string path, ConfigurationReport& report) {
  if (value != kRequireFullWindow && value < 1) {
    AddIssue(report, std::move(path), "must be -1 (full window) or a positive integer");
  }
}

} // namespace

void ValidateConfiguration(const Configuration& configuration, ConfigurationReport& report) {
  if (configuration.flags_before_activation <= 0) {
    AddIssue(report, "MitigationConfiguration.FlagsBeforeActivation", "must be greater than 0");
  }
  if (configuration.deflags_before_deactivation <= 0) {
    AddIssue(report, "MitigationConfiguration.DeflagsBeforeDeactivation",
             "must be greater than 0");
  }
  if (configuration.max_samples <= 0) {
    AddIssue(report, "Performance.MaxSamples", "must be greater than 0");
  }
  ValidateGate(configuration.samples_before_inclusion, "Performance.SamplesBeforeInclusion",
               report);
  ValidateGate(configuration.samples_before_exclusion, "Performance.SamplesBeforeExclusion",
               report);

  for (const auto& [metric, bound] : configuration.thresholds) {
    if (metric.empty()) {
      AddIssue(report, "Thresholds", "metric names must not be empty");
      continue;
    }
    if (metric == metrics::kActivityMetric) {
      AddIssue(report, "Thresholds." + metric, "Activity is reserved and cannot carry a threshold");
      continue;
    }
    if (!std::isfinite(bound) || bound < 0.0) {
      AddIssue(report, "Thresholds." + metric, "must be a finite, non-negative number");
    }
  }

  const EventNames& names = configuration.event_names;
  const std::pair<std::string_view, const std::string*> wire_names[] = {
      {"SampleEvent", &names.sample_event},
      {"StartMitigation", &names.start_mitigation},
      {"StopMitigation", &names.stop_mitigation},
      {"ConfigurationReloaded", &names.configuration_reloaded},
  };
  std::set<std::string> seen;
  for (const auto& [logical_name, wire_name] : wire_names) {
    const std::string path = "EventNames." + std::string(logical_name);
    if (wire_name->empty()) {
      AddIssue(report, path, "must not be empty");
      continue;
    }
    if (!seen.insert(*wire_name).second) {
      AddIssue(report, path, "wire name '" + *wire_name + "' is already used by another event");
    }
  }

  report.valid = report.issues.empty();
}

bool ParseConfigurationText(std::string_view json_text, Configuration& configuration,
                            ConfigurationReport& report) {
  report = ConfigurationReport{};

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    AddIssue(report, "$", parse_error);
    return false;
  }
  if (!root.is_object()) {
    AddIssue(report, "$", "configuration root must be a JSON object");
    return false;
  }

  Configuration parsed;
  ParseVersion(root, parsed, report);
  ParseMitigation(root, parsed, report);
  ParseThresholds(root, parsed, report);
  ParsePerformance(root, parsed, report);
  ParseEventNames(root, parsed, report);

  if (!report.issues.empty()) {
    return false;
  }

  ValidateConfiguration(parsed, report);
  if (!report.valid) {
    return false;
  }

  configuration = std::move(parsed);
  return true;
}

bool LoadConfigurationFile(const fs::path& path, Configuration& configuration,
                           ConfigurationReport& report, core::errors::DetectorError& error) {
  using core::errors::DetectorErrorCode;

  report = ConfigurationReport{};
  error.Clear();

  std::error_code ec;
  if (!fs::is_regular_file(path, ec) || ec) {
    return core::errors::SetDetectorError(error, DetectorErrorCode::kMalformedConfiguration,
                                          "configuration file not found: " + path.string());
  }

  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return core::errors::SetDetectorError(error, DetectorErrorCode::kMalformedConfiguration,
                                          "unable to open configuration file: " + path.string());
  }
  const std::string text((std::istreambuf_iterator<char>(input)),
                         std::istreambuf_iterator<char>());
  if (text.empty()) {
    return core::errors::SetDetectorError(error, DetectorErrorCode::kMalformedConfiguration,
                                          "configuration file is empty: " + path.string());
  }

  if (!ParseConfigurationText(text, configuration, report)) {
    return core::errors::SetDetectorError(error, DetectorErrorCode::kMalformedConfiguration,
                                          path.string() + ": " + SummarizeIssues(report));
  }
  return true;
}

std::string SummarizeIssues(const ConfigurationReport& report) {
  std::string summary;
  for (const auto& issue : report.issues) {
    if (!summary.empty()) {
      summary += "; ";
    }
    summary += issue.path + ": " + issue.message;
  }
  return summary;
}

} // namespace coresidency::config
