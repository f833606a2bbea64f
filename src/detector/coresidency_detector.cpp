#include "detector/coresidency_detector.hpp"

#include "core/time_utils.hpp"
#include "detector/hysteresis_engine.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace coresidency::detector {

namespace {

std::string JoinMetrics(const std::vector<std::string>& metrics) {
  std::string joined;
  for (const auto& metric : metrics) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += metric;
  }
  return joined;
}

} // namespace

CoResidencyDetector::CoResidencyDetector(config::ConfigurationPtr configuration,
                                         events::EventBus& bus, core::logging::Logger& logger)
    : bus_(bus), logger_(logger), configuration_(std::move(configuration)) {
  if (configuration_ == nullptr) {
    logger_.Warn("detector created without configuration; using defaults");
    configuration_ = config::MakeConfigurationPtr(config::Configuration{});
  }
  logger_.Info("co-residency detector initialized",
               {{"version", configuration_->version},
                {"mitigation_enabled", configuration_->mitigation_enabled ? "true" : "false"},
                {"max_samples", std::to_string(configuration_->max_samples)}});
}

bool CoResidencyDetector::OnConfigurationReloaded(config::ConfigurationPtr configuration) {
  if (configuration == nullptr) {
    logger_.Warn("ignoring empty configuration reload");
    return false;
  }

  const std::string version = configuration->version;
  {
    std::lock_guard<std::mutex> lock(config_mu_);
    configuration_ = std::move(configuration);
    ++configuration_reloads_;
  }
  logger_.Info("configuration reloaded", {{"version", version}});
  return true;
}

config::ConfigurationPtr CoResidencyDetector::CurrentConfiguration() const {
  std::lock_guard<std::mutex> lock(config_mu_);
  return configuration_;
}

void CoResidencyDetector::LogInclusionChange(const HostId& host_id, const InclusionChange change) {
  if (change != InclusionChange::kNone) {
    logger_.Info("host inclusion changed", {{"host", host_id}, {"state", ToString(change)}});
  }
}

void CoResidencyDetector::ApplyWindowCapacity(const config::Configuration& configuration) {
  const auto capacity = static_cast<std::size_t>(configuration.max_samples);
  for (auto& [host_id, host] : hosts_) {
    if (host.window.Capacity() == capacity) {
      continue;
    }
    const std::size_t evicted = host.window.SetCapacity(capacity);
    logger_.Debug("host window resized", {{"host", host_id},
                                          {"capacity", std::to_string(capacity)},
                                          {"evicted", std::to_string(evicted)}});
  }
}

bool CoResidencyDetector::OnSampleBatch(const SampleBatch& batch,
                                        core::errors::DetectorError& error) {
  const auto started_at = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> batch_lock(batch_mu_);

  // One snapshot per batch, taken once the batch owns the detector: thresholds
  // and hysteresis counts come from the configuration in force when it runs.
  const config::ConfigurationPtr configuration = CurrentConfiguration();
  std::vector<PendingEmission> emissions;
  std::size_t included_count = 0;
  {
    std::lock_guard<std::mutex> state_lock(state_mu_);

    if (!ValidateSampleBatch(batch, *configuration, error)) {
      ++stats_.batches_rejected;
      logger_.Error("sample batch rejected", {{"error", core::errors::FormatDetectorError(error)},
                                              {"subject", error.subject}});
      return false;
    }

    ApplyWindowCapacity(*configuration);

    for (const auto& [host_id, sample] : batch) {
      auto it = hosts_.find(host_id);
      if (it == hosts_.end()) {
        it = hosts_.emplace(host_id, HostState(static_cast<std::size_t>(configuration->max_samples)))
                 .first;
        logger_.Debug("tracking new host", {{"host", host_id}});
      }
      it->second.RecordSample(sample);
    }

    for (auto& [host_id, host] : hosts_) {
      LogInclusionChange(host_id, UpdateExclusion(host, *configuration));
    }

    // Every included host is evaluated; mitigating hosts stay out of the
    // average they are compared against.
    std::vector<std::pair<const HostId*, HostState*>> included;
    std::vector<const HostState*> population;
    for (auto& [host_id, host] : hosts_) {
      if (!host.included) {
        continue;
      }
      included.emplace_back(&host_id, &host);
      if (!host.mitigating) {
        population.push_back(&host);
      }
    }
    included_count = included.size();

    PopulationAverages averages =
        ComputePopulationAverages(population, configuration->normalize_samples);

    for (auto& [host_id, host] : included) {
      const DeviationVerdict verdict = EvaluateDeviation(*host, averages, *configuration);
      if (verdict.over_threshold) {
        logger_.Debug("host over threshold",
                      {{"host", *host_id}, {"metrics", JoinMetrics(verdict.exceeded_metrics)}});
      }

      switch (ApplyVerdict(*host, verdict.over_threshold, *configuration)) {
      case MitigationTransition::kStart:
        ++stats_.mitigations_started;
        logger_.Info("starting mitigation",
                     {{"host", *host_id}, {"metrics", JoinMetrics(verdict.exceeded_metrics)}});
        emissions.push_back({configuration->event_names.start_mitigation, *host_id});
        break;
      case MitigationTransition::kStop:
        ++stats_.mitigations_stopped;
        logger_.Info("stopping mitigation", {{"host", *host_id}});
        emissions.push_back({configuration->event_names.stop_mitigation, *host_id});
        break;
      case MitigationTransition::kNone:
        break;
      }
    }

    for (auto& [host_id, host] : hosts_) {
      LogInclusionChange(host_id, UpdateInclusion(host, *configuration));
    }

    last_averages_ = std::move(averages);
    ++stats_.batches_processed;
  }

  for (const auto& emission : emissions) {
    bus_.Emit(emission.event_name, emission.host_id);
  }

  logger_.Debug("sample batch processed",
                {{"hosts", std::to_string(batch.size())},
                 {"included", std::to_string(included_count)},
                 {"events", std::to_string(emissions.size())},
                 {"elapsed_ms", std::to_string(core::ElapsedMillis(
                                    started_at, std::chrono::steady_clock::now()))}});
  error.Clear();
  return true;
}

std::set<HostId> CoResidencyDetector::MitigatingHosts() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  std::set<HostId> mitigating;
  for (const auto& [host_id, host] : hosts_) {
    if (host.mitigating) {
      mitigating.insert(host_id);
    }
  }
  return mitigating;
}

PopulationAverages CoResidencyDetector::LastPopulationAverages() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return last_averages_;
}

std::optional<HostSnapshot> CoResidencyDetector::FindHost(const HostId& host_id) const {
  std::lock_guard<std::mutex> lock(state_mu_);
  const auto it = hosts_.find(host_id);
  if (it == hosts_.end()) {
    return std::nullopt;
  }
  return MakeHostSnapshot(it->second);
}

std::size_t CoResidencyDetector::HostCount() const {
  std::lock_guard<std::mutex> lock(state_mu_);
  return hosts_.size();
}

CoResidencyDetector::Stats CoResidencyDetector::GetStats() const {
  Stats stats;
  {
    std::lock_guard<std::mutex> lock(state_mu_);
    stats = stats_;
  }
  std::lock_guard<std::mutex> lock(config_mu_);
  stats.configuration_reloads = configuration_reloads_;
  return stats;
}

} // namespace coresidency::detector
