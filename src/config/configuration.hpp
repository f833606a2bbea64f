#pragma once

#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace coresidency::config {

// Logical event identifiers and their wire names on the event bus.
struct EventNames {
  std::string sample_event = "MetricsSampled";
  std::string start_mitigation = "MitigationStart";
  std::string stop_mitigation = "MitigationStop";
  std::string configuration_reloaded = "ConfigurationReloaded";

  bool operator==(const EventNames& other) const = default;
};

// Sentinel for samples_before_inclusion / samples_before_exclusion meaning
// "require the whole window" (full of activity / empty of activity).
inline constexpr int kRequireFullWindow = -1;

// Immutable detector tuning snapshot.
//
// Instances are only ever shared as `ConfigurationPtr` and replaced wholesale
// on reload; nothing mutates a published snapshot.
struct Configuration {
  std::string version;

  bool mitigation_enabled = true;
  int flags_before_activation = 3;
  int deflags_before_deactivation = 3;

  // Metric name -> maximum tolerated absolute deviation from the population
  // average. The reserved Activity metric never appears here.
  std::map<std::string, double> thresholds;

  int samples_before_inclusion = kRequireFullWindow;
  int samples_before_exclusion = kRequireFullWindow;
  bool normalize_samples = false;
  int max_samples = 5;

  EventNames event_names;

  bool operator==(const Configuration& other) const = default;
};

using ConfigurationPtr = std::shared_ptr<const Configuration>;

inline ConfigurationPtr MakeConfigurationPtr(Configuration configuration) {
  return std::make_shared<const Configuration>(std::move(configuration));
}

// Member of EventNames that holds the wire name for a logical identifier as
// spelled in the configuration file (SampleEvent, StartMitigation,
// StopMitigation, ConfigurationReloaded). nullptr for unknown identifiers.
using WireNameField = std::string EventNames::*;

inline WireNameField FindWireNameField(std::string_view logical_name) {
  if (logical_name == "SampleEvent") {
    return &EventNames::sample_event;
  }
  if (logical_name == "StartMitigation") {
    return &EventNames::start_mitigation;
  }
  if (logical_name == "StopMitigation") {
    return &EventNames::stop_mitigation;
  }
  if (logical_name == "ConfigurationReloaded") {
    return &EventNames::configuration_reloaded;
  }
  return nullptr;
}

} // namespace coresidency::config
