#ifndef CORESIDENCY_TESTS_COMMON_DETECTOR_FIXTURES_HPP_
#define CORESIDENCY_TESTS_COMMON_DETECTOR_FIXTURES_HPP_

#include "assertions.hpp"
#include "config/configuration.hpp"
#include "core/json_utils.hpp"
#include "detector/sample_batch.hpp"
#include "events/event_bus.hpp"
#include "metrics/metric_value.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace coresidency::tests::common {

// Parameters for a configuration file written the way operators write them
// (every leaf under "Value").
struct ConfigurationFixture {
  std::string version = "1.0";
  bool mitigation_enabled = true;
  int flags_before_activation = 3;
  int deflags_before_deactivation = 3;
  std::vector<std::pair<std::string, double>> thresholds = {{"CpuUsage", 10.0}};
  int samples_before_inclusion = 1;
  int samples_before_exclusion = 1;
  bool normalize_samples = false;
  int max_samples = 5;

  // Logical name -> wire name; omitted keys keep their defaults.
  std::vector<std::pair<std::string, std::string>> event_names;
};

inline std::string ToConfigurationJson(const ConfigurationFixture& fixture) {
  const auto bool_text = [](bool value) { return value ? "true" : "false"; };

  std::string json = "{\n";
  json += "  \"Version\": {\"Value\": \"" + core::EscapeJson(fixture.version) + "\"},\n";
  json += "  \"EnableMitigation\": {\"Value\": " + std::string(bool_text(fixture.mitigation_enabled)) +
          ", \"Description\": \"Emit start/stop decisions\"},\n";
  json += "  \"MitigationConfiguration\": {\n";
  json += "    \"FlagsBeforeActivation\": {\"Value\": " +
          std::to_string(fixture.flags_before_activation) + "},\n";
  json += "    \"DeflagsBeforeDeactivation\": {\"Value\": " +
          std::to_string(fixture.deflags_before_deactivation) + "}\n";
  json += "  },\n";

  json += "  \"Thresholds\": {";
  for (std::size_t i = 0; i < fixture.thresholds.size(); ++i) {
    json += i == 0 ? "\n" : ",\n";
    json += "    \"" + core::EscapeJson(fixture.thresholds[i].first) + "\": {\"Value\": " +
            core::FormatJsonNumber(fixture.thresholds[i].second) + "}";
  }
  json += "\n  },\n";

  json += "  \"Performance\": {\n";
  json += "    \"SamplesBeforeInclusion\": {\"Value\": " +
          std::to_string(fixture.samples_before_inclusion) + "},\n";
  json += "    \"SamplesBeforeExclusion\": {\"Value\": " +
          std::to_string(fixture.samples_before_exclusion) + "},\n";
  json += "    \"NormalizeSamples\": {\"Value\": " +
          std::string(bool_text(fixture.normalize_samples)) + "},\n";
  json += "    \"MaxSamples\": {\"Value\": " + std::to_string(fixture.max_samples) + "}\n";
  json += "  }";

  if (!fixture.event_names.empty()) {
    json += ",\n  \"EventNames\": {";
    for (std::size_t i = 0; i < fixture.event_names.size(); ++i) {
      json += i == 0 ? "\n" : ",\n";
      json += "    \"" + fixture.event_names[i].first + "\": {\"Value\": \"" +
              core::EscapeJson(fixture.event_names[i].second) + "\"}";
    }
    json += "\n  }";
  }
  json += "\n}\n";
  return json;
}

inline void WriteFixtureFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  if (!file_path.parent_path().empty()) {
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
      Fail("failed to create fixture directory: " + file_path.parent_path().string());
    }
  }

  std::ofstream output(file_path, std::ios::binary | std::ios::trunc);
  if (!output) {
    Fail("failed to open fixture file for writing: " + file_path.string());
  }
  output << content;
  if (!output) {
    Fail("failed while writing fixture file: " + file_path.string());
  }
}

// Rewrites a watched file and moves its modification time forward so the
// change is visible even on filesystems with coarse timestamps.
inline void RewriteWatchedFile(const std::filesystem::path& file_path, std::string_view content) {
  std::error_code ec;
  const auto before = std::filesystem::last_write_time(file_path, ec);
  WriteFixtureFile(file_path, content);
  if (!ec) {
    std::filesystem::last_write_time(file_path, before + std::chrono::seconds(2), ec);
  }
}

inline config::ConfigurationPtr MakeConfiguration(const ConfigurationFixture& fixture) {
  config::Configuration configuration;
  configuration.version = fixture.version;
  configuration.mitigation_enabled = fixture.mitigation_enabled;
  configuration.flags_before_activation = fixture.flags_before_activation;
  configuration.deflags_before_deactivation = fixture.deflags_before_deactivation;
  for (const auto& [metric, bound] : fixture.thresholds) {
    configuration.thresholds[metric] = bound;
  }
  configuration.samples_before_inclusion = fixture.samples_before_inclusion;
  configuration.samples_before_exclusion = fixture.samples_before_exclusion;
  configuration.normalize_samples = fixture.normalize_samples;
  configuration.max_samples = fixture.max_samples;
  for (const auto& [logical_name, wire_name] : fixture.event_names) {
    const config::WireNameField field = config::FindWireNameField(logical_name);
    if (field == nullptr) {
      Fail("unknown logical event name in fixture: " + logical_name);
    }
    configuration.event_names.*field = wire_name;
  }
  return config::MakeConfigurationPtr(std::move(configuration));
}

// One host's sample: Activity plus named metrics.
inline metrics::MetricMap Sample(double activity,
                                 std::initializer_list<std::pair<const char*, double>> values) {
  metrics::MetricMap sample;
  sample[std::string(metrics::kActivityMetric)] = metrics::MetricValue(activity);
  for (const auto& [name, value] : values) {
    sample[name] = metrics::MetricValue(value);
  }
  return sample;
}

// Active hosts reporting one CpuUsage value each.
inline detector::SampleBatch CpuBatch(std::initializer_list<std::pair<const char*, double>> hosts) {
  detector::SampleBatch batch;
  for (const auto& [host, cpu] : hosts) {
    batch[host] = Sample(1.0, {{"CpuUsage", cpu}});
  }
  return batch;
}

// Records every host-ID payload delivered under one wire name.
class HostEventRecorder {
public:
  HostEventRecorder(events::EventBus& bus, std::string event_name) : bus_(bus) {
    token_ = bus_.Subscribe(std::move(event_name), [this](const events::EventPayload& payload) {
      const auto* host = std::get_if<detector::HostId>(&payload);
      if (host == nullptr) {
        return;
      }
      std::lock_guard<std::mutex> lock(mu_);
      hosts_.push_back(*host);
    });
  }

  ~HostEventRecorder() { bus_.Unsubscribe(token_); }

  HostEventRecorder(const HostEventRecorder&) = delete;
  HostEventRecorder& operator=(const HostEventRecorder&) = delete;

  std::vector<detector::HostId> Hosts() const {
    std::lock_guard<std::mutex> lock(mu_);
    return hosts_;
  }

  std::size_t Count() const {
    std::lock_guard<std::mutex> lock(mu_);
    return hosts_.size();
  }

private:
  events::EventBus& bus_;
  events::SubscriptionToken token_ = 0;
  mutable std::mutex mu_;
  std::vector<detector::HostId> hosts_;
};

} // namespace coresidency::tests::common

#endif // CORESIDENCY_TESTS_COMMON_DETECTOR_FIXTURES_HPP_
