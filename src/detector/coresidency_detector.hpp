#pragma once

#include "config/configuration.hpp"
#include "core/errors/detector_error.hpp"
#include "core/logging/logger.hpp"
#include "detector/host_state.hpp"
#include "detector/hysteresis_engine.hpp"
#include "detector/sample_batch.hpp"
#include "detector/statistics_engine.hpp"
#include "events/event_bus.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace coresidency::detector {

// Decides, batch by batch, which hosts deviate far enough from the population
// to start or stop mitigation, and publishes those decisions on the bus.
//
// Threading:
// - OnConfigurationReloaded() may run on any thread at any time. It swaps the
//   shared snapshot; a batch takes its snapshot once it holds the batch lock
//   and finishes against it.
// - OnSampleBatch() calls are serialized. Start/stop events are emitted
//   synchronously from inside the call, one per transition, in host-ID order.
// - Mitigation handlers may call the read accessors below but must not feed
//   another batch into the same detector from inside the handler.
class CoResidencyDetector {
public:
  struct Stats {
    std::uint64_t batches_processed = 0;
    std::uint64_t batches_rejected = 0;
    std::uint64_t mitigations_started = 0;
    std::uint64_t mitigations_stopped = 0;
    std::uint64_t configuration_reloads = 0;
  };

  CoResidencyDetector(config::ConfigurationPtr configuration, events::EventBus& bus,
                      core::logging::Logger& logger);

  CoResidencyDetector(const CoResidencyDetector&) = delete;
  CoResidencyDetector& operator=(const CoResidencyDetector&) = delete;

  // Ingests one batch.
  //
  // Contract:
  // - true: host windows, counters and inclusion were updated and any
  //   transitions were emitted.
  // - false: `error` is INVALID_SAMPLE_BATCH or CONFIGURATION_MISMATCH and no
  //   host state was touched.
  bool OnSampleBatch(const SampleBatch& batch, core::errors::DetectorError& error);

  // Installs `configuration` for every batch that starts after this call.
  // Returns false (and keeps the current snapshot) when it is null.
  bool OnConfigurationReloaded(config::ConfigurationPtr configuration);

  config::ConfigurationPtr CurrentConfiguration() const;

  std::set<HostId> MitigatingHosts() const;

  // Population averages computed by the most recent accepted batch.
  PopulationAverages LastPopulationAverages() const;

  std::optional<HostSnapshot> FindHost(const HostId& host_id) const;

  std::size_t HostCount() const;

  Stats GetStats() const;

private:
  struct PendingEmission {
    std::string event_name;
    HostId host_id;
  };

  void ApplyWindowCapacity(const config::Configuration& configuration);
  void LogInclusionChange(const HostId& host_id, InclusionChange change);

  events::EventBus& bus_;
  core::logging::Logger& logger_;

  mutable std::mutex config_mu_;
  config::ConfigurationPtr configuration_;
  std::uint64_t configuration_reloads_ = 0;

  // Serializes whole batches, including their event emission.
  std::mutex batch_mu_;

  mutable std::mutex state_mu_;
  std::map<HostId, HostState> hosts_;
  PopulationAverages last_averages_;
  Stats stats_;
};

} // namespace coresidency::detector
