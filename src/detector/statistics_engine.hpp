#pragma once

#include "config/configuration.hpp"
#include "detector/host_state.hpp"
#include "metrics/metric_value.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace coresidency::detector {

// Metric name -> population average over the included hosts that are not
// mitigating (Activity is never part of it).
using PopulationAverages = std::map<std::string, metrics::MetricValue>;

// A host's value for `metric` as it enters the statistics:
// - normalize == true: the host's own windowed average, so hosts with fewer
//   retained samples are not penalized by window fill level
// - normalize == false: the latest sample value
metrics::MetricValue HostContribution(const HostState& host, std::string_view metric,
                                      bool normalize);

// Computes one average per non-Activity metric over `included_hosts`.
//
// Contract:
// - the metric set is the union of metrics retained by the included hosts
//   (latest sample only when not normalizing)
// - a host lacking a metric contributes the neutral element
// - no hosts yields an empty result, which EvaluateDeviation treats as
//   "not over threshold"
// - recomputed from the windows on every call; nothing is carried over
PopulationAverages ComputePopulationAverages(const std::vector<const HostState*>& included_hosts,
                                             bool normalize);

struct DeviationVerdict {
  // True when any thresholded metric's deviation strictly exceeds its bound.
  bool over_threshold = false;

  // |host value - population average| per thresholded metric present in the
  // averages.
  std::map<std::string, metrics::MetricValue> deviations;

  // Metrics whose deviation exceeded the bound, in name order.
  std::vector<std::string> exceeded_metrics;
};

// Compares one host against the population. The trigger is a logical OR over
// metrics, not a weighted score.
DeviationVerdict EvaluateDeviation(const HostState& host, const PopulationAverages& averages,
                                   const config::Configuration& configuration);

} // namespace coresidency::detector
