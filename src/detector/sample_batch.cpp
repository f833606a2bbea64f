#include "detector/sample_batch.hpp"

#include "core/json_dom.hpp"

#include <set>
#include <utility>

namespace coresidency::detector {

namespace {

using core::errors::DetectorErrorCode;
using core::errors::SetDetectorError;

std::set<std::string> KeySet(const metrics::MetricMap& sample) {
  std::set<std::string> keys;
  for (const auto& [metric, value] : sample) {
    keys.insert(metric);
  }
  return keys;
}

std::string JoinKeys(const std::set<std::string>& keys) {
  std::string joined;
  for (const auto& key : keys) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += key;
  }
  return "{" + joined + "}";
}

} // namespace

bool ValidateSampleBatch(const SampleBatch& batch, const config::Configuration& configuration,
                         core::errors::DetectorError& error) {
  error.Clear();

  const std::string activity_key(metrics::kActivityMetric);
  const HostId* reference_host = nullptr;
  std::set<std::string> reference_keys;

  for (const auto& [host_id, sample] : batch) {
    if (host_id.empty()) {
      return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                              "host ID must not be empty");
    }

    const auto activity = sample.find(activity_key);
    if (activity == sample.end()) {
      return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                              "host '" + host_id + "' is missing the Activity metric", host_id);
    }
    if (activity->second != metrics::MetricValue(0.0) &&
        activity->second != metrics::MetricValue(1.0)) {
      return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                              "host '" + host_id + "' reports Activity outside {0,1}", host_id);
    }

    for (const auto& [metric, value] : sample) {
      if (metric.empty()) {
        return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                                "host '" + host_id + "' reports an empty metric name", host_id);
      }
      if (!value.IsFinite()) {
        return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                                "host '" + host_id + "' metric '" + metric +
                                    "' is not a finite number",
                                host_id);
      }
    }

    std::set<std::string> keys = KeySet(sample);
    if (reference_host == nullptr) {
      reference_host = &host_id;
      reference_keys = std::move(keys);
    } else if (keys != reference_keys) {
      return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                              "host '" + host_id + "' metric set " + JoinKeys(keys) +
                                  " differs from host '" + *reference_host + "' metric set " +
                                  JoinKeys(reference_keys),
                              host_id);
    }
  }

  if (!configuration.mitigation_enabled) {
    return true;
  }

  // Key sets are homogeneous at this point, so checking one host covers all.
  for (const auto& metric : reference_keys) {
    if (metric == activity_key) {
      continue;
    }
    if (configuration.thresholds.count(metric) == 0U) {
      return SetDetectorError(error, DetectorErrorCode::kConfigurationMismatch,
                              "metric '" + metric + "' has no configured threshold", metric);
    }
  }
  return true;
}

bool DecodeSampleBatchJson(std::string_view json_text, SampleBatch& batch,
                           core::errors::DetectorError& error) {
  error.Clear();

  core::json::Value root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch, parse_error);
  }
  if (!root.is_object()) {
    return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                            "sample batch must be a JSON object keyed by host ID");
  }

  SampleBatch decoded;
  for (const auto& [host_id, host_node] : root.object_value) {
    if (!host_node.is_object()) {
      return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                              "host '" + host_id + "' must map to a metric object", host_id);
    }

    metrics::MetricMap& sample = decoded[host_id];
    for (const auto& [metric, value_node] : host_node.object_value) {
      if (value_node.is_number()) {
        sample.emplace(metric, metrics::MetricValue(value_node.number_value));
      } else if (value_node.is_bool()) {
        sample.emplace(metric, metrics::MetricValue(value_node.bool_value ? 1.0 : 0.0));
      } else {
        return SetDetectorError(error, DetectorErrorCode::kInvalidSampleBatch,
                                "host '" + host_id + "' metric '" + metric + "' must be numeric (got " +
                                    core::json::TypeName(value_node.type) + ")",
                                host_id);
      }
    }
  }

  batch = std::move(decoded);
  return true;
}

} // namespace coresidency::detector
