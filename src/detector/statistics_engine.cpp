#include "detector/statistics_engine.hpp"

#include <set>

namespace coresidency::detector {

namespace {

void CollectMetricNames(const metrics::MetricMap& sample, std::set<std::string>& names) {
  for (const auto& [metric, value] : sample) {
    if (metric != metrics::kActivityMetric) {
      names.insert(metric);
    }
  }
}

std::set<std::string> ReportedMetrics(const std::vector<const HostState*>& hosts,
                                      const bool normalize) {
  std::set<std::string> names;
  for (const HostState* host : hosts) {
    if (host->window.Empty()) {
      continue;
    }
    const auto& samples = host->window.Samples();
    if (!normalize) {
      CollectMetricNames(samples.back(), names);
      continue;
    }
    for (const auto& sample : samples) {
      CollectMetricNames(sample, names);
    }
  }
  return names;
}

} // namespace

metrics::MetricValue HostContribution(const HostState& host, std::string_view metric,
                                      const bool normalize) {
  if (normalize) {
    return host.window.Average(metric);
  }
  return host.window.Latest(metric);
}

PopulationAverages ComputePopulationAverages(const std::vector<const HostState*>& included_hosts,
                                             const bool normalize) {
  PopulationAverages averages;
  if (included_hosts.empty()) {
    return averages;
  }

  for (const auto& metric : ReportedMetrics(included_hosts, normalize)) {
    metrics::MetricValue sum;
    for (const HostState* host : included_hosts) {
      sum += HostContribution(*host, metric, normalize);
    }
    averages.emplace(metric, metrics::MeanOf(sum, included_hosts.size()));
  }
  return averages;
}

DeviationVerdict EvaluateDeviation(const HostState& host, const PopulationAverages& averages,
                                   const config::Configuration& configuration) {
  DeviationVerdict verdict;

  for (const auto& [metric, bound] : configuration.thresholds) {
    const auto average = averages.find(metric);
    if (average == averages.end()) {
      continue;
    }

    const metrics::MetricValue deviation = metrics::AbsoluteDifference(
        HostContribution(host, metric, configuration.normalize_samples), average->second);
    verdict.deviations.emplace(metric, deviation);

    if (metrics::MetricValue(bound) < deviation) {
      verdict.over_threshold = true;
      verdict.exceeded_metrics.push_back(metric);
    }
  }
  return verdict;
}

} // namespace coresidency::detector
